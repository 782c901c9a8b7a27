//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <soapclient/config.hpp>

#include <istream>

#include <soapclient/exception.hpp>
#include <soapclient/soap/config-file.hpp>
#include <soapclient/soap/envelope.hpp>

namespace po = boost::program_options;

namespace soapclient::soap
{

po::options_description client_config_options()
{
	po::options_description result("client options");
	result.add_options()
		("url",							po::value<std::string>(),	"The endpoint of the service")
		("user-agent",					po::value<std::string>(),	"The User-Agent header")
		("namespace",					po::value<std::string>(),	"The SOAP namespace")
		("urn-namespace",				po::value<std::string>(),	"The urn namespace")
		("tns-namespace",				po::value<std::string>(),	"The tns namespace")
		("xsi-namespace",				po::value<std::string>(),	"The xsi namespace")
		("exclude-action-namespace",	po::value<bool>(),			"Send the bare action name as SOAPAction")
		("envelope-namespace",			po::value<std::string>(),	"The namespace of the envelope")
		("content-type",				po::value<std::string>(),	"The Content-Type of requests")
		("timeout",						po::value<long>(),			"Time in milliseconds a round trip may take")
		("verbose",						po::value<int>(),			"Trace level")
		("auth.namespace",				po::value<std::string>(),	"Namespace of the authentication header")
		("auth.username",				po::value<std::string>(),	"User name for the authentication header")
		("auth.password",				po::value<std::string>(),	"Password for the authentication header")
		;

	for (size_t i = 0; i < kNamespaceSlotCount; ++i)
	{
		auto name = "namespaces.tns" + std::to_string(i);
		result.add_options()(name.c_str(), po::value<std::string>(), "Namespace for an extra prefix");
	}

	return result;
}

client_config make_client_config(const po::variables_map& vm)
{
	client_config result;

	auto assign = [&vm](const char* option, std::string& value)
	{
		if (vm.count(option))
			value = vm[option].as<std::string>();
	};

	assign("url", result.url);
	assign("user-agent", result.user_agent);
	assign("namespace", result.name_space);
	assign("urn-namespace", result.urn_namespace);
	assign("tns-namespace", result.tns_namespace);
	assign("xsi-namespace", result.xsi_namespace);
	assign("envelope-namespace", result.envelope_namespace);
	assign("content-type", result.content_type);

	if (vm.count("exclude-action-namespace"))
		result.exclude_action_namespace = vm["exclude-action-namespace"].as<bool>();

	if (vm.count("timeout"))
	{
		auto timeout = vm["timeout"].as<long>();
		if (timeout < 0)
			throw exception("invalid timeout " + std::to_string(timeout));
		result.timeout = std::chrono::milliseconds(timeout);
	}

	if (vm.count("verbose"))
		result.verbose = vm["verbose"].as<int>();

	if (vm.count("auth.username"))
	{
		auth_header auth;
		assign("auth.namespace", auth.name_space);
		assign("auth.username", auth.username);
		assign("auth.password", auth.password);
		result.header = auth;
	}

	for (size_t i = 0; i < kNamespaceSlotCount; ++i)
	{
		auto slot = "tns" + std::to_string(i);
		auto option = "namespaces." + slot;
		if (vm.count(option))
			result.used_namespaces[slot] = vm[option].as<std::string>();
	}

	return result;
}

client_config read_client_config(std::istream& is)
{
	try
	{
		po::variables_map vm;
		po::store(po::parse_config_file(is, client_config_options()), vm);
		po::notify(vm);

		return make_client_config(vm);
	}
	catch (const po::error& e)
	{
		throw exception(std::string("invalid configuration: ") + e.what());
	}
}

} // namespace soapclient::soap
