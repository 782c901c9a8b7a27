//           Copyright Maarten L. Hekkelman, 2024
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

// soap-call sends the XML in a file as body of a SOAP request and prints
// the body of the reply.

#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>

#include <soapclient/soap/client.hpp>
#include <soapclient/soap/config-file.hpp>

namespace po = boost::program_options;

int main(int argc, const char* argv[])
{
	using namespace std::literals;

	po::options_description visible_options(argv[0] + " [options] request-file"s);
	visible_options.add_options()
		("help,h",									"Display help message")
		("version",									"Print version")
		("config,c",		po::value<std::string>(),	"Configuration file to read")
		("action,a",		po::value<std::string>(),	"The SOAP action, default is the name of the root element of the request")
		("soap12",										"Send a SOAP 1.2 request")
		;

	po::options_description hidden_options("hidden options");
	hidden_options.add_options()
		("request-file",	po::value<std::string>(),	"File containing the XML of the request")
		;

	po::options_description client_options = soapclient::soap::client_config_options();

	po::options_description cmdline_options;
	cmdline_options.add(visible_options).add(client_options).add(hidden_options);

	po::positional_options_description p;
	p.add("request-file", 1);

	try
	{
		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv).options(cmdline_options).positional(p).run(), vm);

		if (vm.count("config"))
		{
			std::ifstream file(vm["config"].as<std::string>());
			if (not file.is_open())
				throw std::runtime_error("Could not open configuration file " + vm["config"].as<std::string>());

			// values from the command line take precedence
			po::store(po::parse_config_file(file, client_options), vm);
		}

		po::notify(vm);

		if (vm.count("help"))
		{
			std::cerr << visible_options << std::endl
					  << client_options << std::endl;
			return 0;
		}

		if (vm.count("version"))
		{
			std::cout << argv[0] << " version " << SOAPCLIENT_VERSION << std::endl;
			return 0;
		}

		if (vm.count("request-file") == 0)
		{
			std::cerr << visible_options << std::endl;
			return 1;
		}

		auto config = soapclient::soap::make_client_config(vm);
		if (config.url.empty())
			throw std::runtime_error("No url specified");

		if (config.user_agent.empty())
			config.user_agent = SOAPCLIENT_DEFAULT_USER_AGENT;

		std::ifstream file(vm["request-file"].as<std::string>());
		if (not file.is_open())
			throw std::runtime_error("Could not open request file " + vm["request-file"].as<std::string>());

		soapclient::xml::document request(file);
		if (request.child() == nullptr)
			throw std::runtime_error("The request file is empty");

		std::string action = vm.count("action") ? vm["action"].as<std::string>() : request.child()->name();

		soapclient::soap::client client(std::move(config));
		soapclient::xml::element response;

		if (vm.count("soap12"))
			client.round_trip_soap12(action, request, response);
		else
			client.round_trip_with_action(action, request, response);

		soapclient::xml::format_info fmt;
		fmt.indent = true;
		fmt.indent_width = 2;

		for (auto& e : response)
		{
			e.write(std::cout, fmt);
			std::cout << std::endl;
		}
	}
	catch (const soapclient::soap::http_error& ex)
	{
		std::cerr << "The server replied with an error: " << ex.status() << std::endl
				  << ex.body() << std::endl;
		return 1;
	}
	catch (const std::exception& ex)
	{
		std::cerr << ex.what() << std::endl;
		return 1;
	}

	return 0;
}
