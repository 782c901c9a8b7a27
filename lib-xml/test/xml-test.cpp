#define BOOST_TEST_MODULE XML_Test
#include <boost/test/included/unit_test.hpp>

#include <soapclient/config.hpp>

#include <memory>
#include <optional>
#include <sstream>
#include <variant>
#include <vector>

#include <soapclient/xml/document.hpp>

using namespace std;
using namespace soapclient::xml;

struct st_1
{
	int		i;
	string	s;

	template<class Archive>
	void serialize(Archive& ar, unsigned long /*v*/)
	{
		ar & SOAPCLIENT_ELEMENT_NAME_VALUE(i) & SOAPCLIENT_ELEMENT_NAME_VALUE(s);
	}

	bool operator==(const st_1& rhs) const { return i == rhs.i and s == rhs.s; }
};

struct st_attr
{
	string id;
	string kind;

	template<class Archive>
	void serialize(Archive& ar, unsigned long /*v*/)
	{
		ar & make_attribute_nvp("id", id, true)
		   & make_attribute_nvp("kind", kind);
	}
};

struct st_opt
{
	optional<int> o;
	unique_ptr<string> p;
	vector<int> v;

	template<class Archive>
	void serialize(Archive& ar, unsigned long /*v*/)
	{
		ar & make_element_nvp("o", o)
		   & make_element_nvp("p", p)
		   & make_element_nvp("v", v);
	}
};

enum class color
{
	red, green, blue
};

struct st_values
{
	color c = color::red;
	bool b = false;
	double d = 0;
	boost::posix_time::ptime t;
	boost::gregorian::date day;

	template<class Archive>
	void serialize(Archive& ar, unsigned long /*v*/)
	{
		ar & make_element_nvp("c", c)
		   & make_element_nvp("b", b)
		   & make_element_nvp("d", d)
		   & make_element_nvp("t", t)
		   & make_attribute_nvp("day", day);
	}
};

string write_doc(const document& doc)
{
	ostringstream os;
	os << doc;
	return os.str();
}

BOOST_AUTO_TEST_CASE(xml_parse_1)
{
	using namespace soapclient::xml::literals;

	auto doc = R"(<test a="1"><b>x</b><c/></test>)"_xml;

	BOOST_TEST_REQUIRE(doc.child() != nullptr);
	BOOST_TEST(doc.child()->get_qname() == "test");
	BOOST_TEST(doc.child()->get_attribute("a") == "1");
	BOOST_TEST(doc.child()->size() == 2);

	auto b = doc.child()->find_first("b");
	BOOST_TEST_REQUIRE(b != nullptr);
	BOOST_TEST(b->get_content() == "x");
}

BOOST_AUTO_TEST_CASE(xml_parse_whitespace)
{
	using namespace soapclient::xml::literals;

	auto doc = R"(<test>
	<b> x </b>
</test>)"_xml;

	BOOST_TEST(doc.child()->get_content() == "");
	BOOST_TEST(doc.child()->front().get_content() == " x ");
}

BOOST_AUTO_TEST_CASE(xml_parse_error)
{
	document doc;

	BOOST_CHECK_THROW(doc.read("<a><b></a>"), parse_error);
	BOOST_CHECK_THROW(doc.read(""), parse_error);

	try
	{
		doc.read("<a>\n<b></a>");
		BOOST_FAIL("expected a parse error");
	}
	catch (const parse_error& e)
	{
		BOOST_TEST(e.get_line() == 2);
	}
}

BOOST_AUTO_TEST_CASE(xml_write_1)
{
	document doc;
	auto& e = doc.emplace_back("a");
	e.set_attribute("x", "1 & 2");

	BOOST_TEST(write_doc(doc) == R"(<a x="1 &amp; 2"/>)");

	e.emplace_back("b").set_content("<text>");
	BOOST_TEST(write_doc(doc) == R"(<a x="1 &amp; 2"><b>&lt;text&gt;</b></a>)");

	doc.set_write_xml_decl(true);
	BOOST_TEST(write_doc(doc) == R"(<?xml version="1.0" encoding="UTF-8"?><a x="1 &amp; 2"><b>&lt;text&gt;</b></a>)");
}

BOOST_AUTO_TEST_CASE(xml_write_invalid_character)
{
	// control characters are not allowed in XML 1.0, not even as character reference
	document doc;
	doc.emplace_back("a").set_content(string("bell \x07 nul ") + '\0' + " end");

	BOOST_TEST(write_doc(doc) == "<a>bell \xef\xbf\xbd nul \xef\xbf\xbd end</a>");
}

BOOST_AUTO_TEST_CASE(xml_write_invalid_utf8)
{
	document doc;
	auto& e = doc.emplace_back("a");

	// a latin-1 e-acute, a lone continuation byte, a truncated sequence and an encoded surrogate
	e.set_content("caf\xe9 \x80 \xe2\x82 \xed\xa0\x80");
	e.set_attribute("x", "\xff");

	auto text = write_doc(doc);
	BOOST_TEST(text == "<a x=\"\xef\xbf\xbd\">caf\xef\xbf\xbd \xef\xbf\xbd \xef\xbf\xbd\xef\xbf\xbd \xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd</a>");

	// and the result is well formed again
	document doc2(text);
	BOOST_TEST(doc2.child()->get_content() == "caf\xef\xbf\xbd \xef\xbf\xbd \xef\xbf\xbd\xef\xbf\xbd \xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd");
}

BOOST_AUTO_TEST_CASE(xml_write_valid_utf8)
{
	// two, three and four byte sequences and U+FFFD itself pass unchanged
	const string text = "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80 \xef\xbf\xbd";

	document doc;
	doc.emplace_back("a").set_content(text);

	BOOST_TEST(write_doc(doc) == "<a>" + text + "</a>");
}

BOOST_AUTO_TEST_CASE(xml_serialize_1)
{
	st_1 v{ 42, "aap" };

	document doc;
	doc.serialize("test", v);

	BOOST_TEST(write_doc(doc) == "<test><i>42</i><s>aap</s></test>");

	st_1 v2{};
	doc.deserialize("test", v2);

	BOOST_TEST((v == v2));
}

BOOST_AUTO_TEST_CASE(xml_deserialize_prefixed)
{
	using namespace soapclient::xml::literals;

	auto doc = R"(<ns:test xmlns:ns="urn:x"><ns:i>1</ns:i><ns:s>noot</ns:s></ns:test>)"_xml;

	st_1 v{};
	doc.deserialize("test", v);

	BOOST_TEST(v.i == 1);
	BOOST_TEST(v.s == "noot");

	// a prefixed name must match exactly
	BOOST_CHECK_THROW(doc.deserialize("other:test", v), soapclient::exception);
}

BOOST_AUTO_TEST_CASE(xml_attribute_omit_empty)
{
	st_attr a;

	document doc;
	doc.serialize("e", a);
	BOOST_TEST(write_doc(doc) == R"(<e kind=""/>)");

	a.id = "x";
	a.kind = "y";

	document doc2;
	doc2.serialize("e", a);
	BOOST_TEST(write_doc(doc2) == R"(<e id="x" kind="y"/>)");

	st_attr b;
	doc2.deserialize("e", b);
	BOOST_TEST(b.id == "x");
	BOOST_TEST(b.kind == "y");
}

BOOST_AUTO_TEST_CASE(xml_optional_and_pointers)
{
	st_opt v;

	document doc;
	doc.serialize("t", v);
	BOOST_TEST(write_doc(doc) == "<t/>");

	v.o = 1;
	v.p = make_unique<string>("mies");
	v.v = { 1, 2, 3 };

	document doc2;
	doc2.serialize("t", v);
	BOOST_TEST(write_doc(doc2) == "<t><o>1</o><p>mies</p><v>1</v><v>2</v><v>3</v></t>");

	st_opt v2;
	doc2.deserialize("t", v2);

	BOOST_TEST(v2.o.has_value());
	BOOST_TEST(*v2.o == 1);
	BOOST_TEST_REQUIRE((v2.p != nullptr));
	BOOST_TEST(*v2.p == "mies");
	BOOST_TEST(v2.v == vector<int>({ 1, 2, 3 }));
}

BOOST_AUTO_TEST_CASE(xml_value_types)
{
	soapclient::value_serializer<color>::init("color", {
		{ color::red, "red" },
		{ color::green, "green" },
		{ color::blue, "blue" }
	});

	st_values v;
	v.c = color::blue;
	v.b = true;
	v.d = 1.5;
	v.t = boost::posix_time::ptime(boost::gregorian::date(2024, 5, 1), boost::posix_time::hours(13) + boost::posix_time::minutes(5));
	v.day = boost::gregorian::date(2024, 2, 29);

	document doc;
	doc.serialize("v", v);
	BOOST_TEST(write_doc(doc) == R"(<v day="2024-02-29"><c>blue</c><b>true</b><d>1.5</d><t>2024-05-01T13:05:00</t></v>)");

	using namespace soapclient::xml::literals;

	auto doc2 = R"(<v day="2023-12-31"><c>green</c><b>1</b><d>-2.25</d><t>2023-12-31T23:59:59Z</t></v>)"_xml;

	st_values v2;
	doc2.deserialize("v", v2);

	BOOST_TEST((v2.c == color::green));
	BOOST_TEST(v2.b);
	BOOST_TEST(v2.d == -2.25);
	BOOST_TEST(boost::posix_time::to_iso_extended_string(v2.t) == "2023-12-31T23:59:59");
	BOOST_TEST((v2.day == boost::gregorian::date(2023, 12, 31)));

	auto doc3 = R"(<v><t>yesterday</t></v>)"_xml;
	BOOST_CHECK_THROW(doc3.deserialize("v", v2), soapclient::exception);
}

BOOST_AUTO_TEST_CASE(xml_variant)
{
	variant<int, string> v = string("wim");

	document doc;
	doc.serialize("t", v);
	BOOST_TEST(write_doc(doc) == "<t>wim</t>");
}

BOOST_AUTO_TEST_CASE(xml_element_as_value)
{
	using namespace soapclient::xml::literals;

	auto content = R"(<payload a="1"><x>y</x></payload>)"_xml;

	document doc;
	doc.serialize("wrapper", content);
	BOOST_TEST(write_doc(doc) == R"(<wrapper><payload a="1"><x>y</x></payload></wrapper>)");

	element e;
	deserializer ds(doc);
	ds.deserialize_element("wrapper", e);

	BOOST_TEST(e.size() == 1);
	BOOST_TEST(e.front().get_qname() == "payload");
}

BOOST_AUTO_TEST_CASE(xml_sniff_encoding)
{
	BOOST_TEST(sniff_declared_encoding(R"(<?xml version="1.0" encoding="windows-1252"?><a/>)") == "windows-1252");
	BOOST_TEST(sniff_declared_encoding(R"(<?xml version='1.0' encoding='ISO-8859-1' standalone='yes'?><a/>)") == "ISO-8859-1");
	BOOST_TEST(sniff_declared_encoding(R"(<?xml version="1.0"?><a/>)") == "");
	BOOST_TEST(sniff_declared_encoding("<a/>") == "");

	BOOST_TEST(is_utf8_label("UTF-8"));
	BOOST_TEST(is_utf8_label("utf8"));
	BOOST_TEST(not is_utf8_label("windows-1252"));
}

BOOST_AUTO_TEST_CASE(xml_charset_windows_1252)
{
	// 0xe9 is e-acute and 0x80 the euro sign in windows-1252
	string text = R"(<?xml version="1.0" encoding="windows-1252"?><a>caf)";
	text += '\xe9';
	text += ' ';
	text += '\x80';
	text += "</a>";

	document doc;
	doc.read(text, &charset_resolver::instance());

	BOOST_TEST(doc.get_declared_encoding() == "windows-1252");
	BOOST_TEST(doc.child()->get_content() == "caf\xc3\xa9 \xe2\x82\xac");
}

BOOST_AUTO_TEST_CASE(xml_charset_latin1_by_expat)
{
	string text = R"(<?xml version="1.0" encoding="ISO-8859-1"?><a>caf)";
	text += '\xe9';
	text += "</a>";

	document doc;
	doc.read(text);

	BOOST_TEST(doc.child()->get_content() == "caf\xc3\xa9");
}

BOOST_AUTO_TEST_CASE(xml_charset_latin1_labels)
{
	// 0x80 to 0x9f are control characters in ISO-8859-1 but the latin-1
	// labels are read as windows-1252, 0x80 is the euro sign and 0x93 a quote
	for (string label : { "latin1", "l1", "ISO-8859-1", "iso8859-1", "ISO_8859-1" })
	{
		string text = R"(<?xml version="1.0" encoding=")" + label + R"("?><a>)";
		text += '\x80';
		text += '\x93';
		text += '\xe9';
		text += "</a>";

		document doc;
		doc.read(text, &charset_resolver::instance());

		BOOST_TEST(doc.child()->get_content() == "\xe2\x82\xac\xe2\x80\x9c\xc3\xa9");
	}
}

BOOST_AUTO_TEST_CASE(xml_charset_unknown)
{
	document doc;
	BOOST_CHECK_THROW(doc.read(R"(<?xml version="1.0" encoding="x-no-such-charset"?><a/>)", &charset_resolver::instance()), unknown_charset);
}

BOOST_AUTO_TEST_CASE(xml_name_matches)
{
	element e("soap:Body");

	BOOST_TEST(name_matches(e, "soap:Body"));
	BOOST_TEST(name_matches(e, "Body"));
	BOOST_TEST(not name_matches(e, "env:Body"));
	BOOST_TEST(not name_matches(e, "body"));
}
