//           Copyright Maarten L. Hekkelman, 2024
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <iostream>

#include <soapclient/soap/client.hpp>

//[ cart_items
struct Item
{
    std::string name;
    uint32_t	count;

    template<typename Archive>
    void serialize(Archive& ar, unsigned long version)
    {
        ar & soapclient::make_nvp("name", name)
           & soapclient::make_nvp("count", count);
    }
};

struct Cart
{
    int					id;
    std::string			client;
    std::vector<Item>	items;

    template<typename Archive>
    void serialize(Archive& ar, unsigned long version)
    {
        ar & soapclient::make_nvp("id", id)
           & soapclient::make_nvp("client", client)
           & soapclient::make_nvp("items", items);
    }
};
//]

//[ cart_messages
/*<< The SOAPAction for this request is the name of the type, "create" >>*/
struct create
{
    struct parameters
    {
        std::string client;

        template<typename Archive>
        void serialize(Archive& ar, unsigned long version)
        {
            ar & soapclient::make_nvp("client", client);
        }
    } request;

    template<typename Archive>
    void serialize(Archive& ar, unsigned long version)
    {
        ar & soapclient::make_nvp("create", request);
    }
};

struct create_response
{
    struct result
    {
        int id;

        template<typename Archive>
        void serialize(Archive& ar, unsigned long version)
        {
            ar & soapclient::make_nvp("id", id);
        }
    } response;

    template<typename Archive>
    void serialize(Archive& ar, unsigned long version)
    {
        ar & soapclient::make_nvp("createResponse", response);
    }
};

/*<< Here the SOAPAction is taken from soap_action() >>*/
struct retrieve_cart
{
    static std::string soap_action() { return "retrieve"; }

    struct parameters
    {
        int id;

        template<typename Archive>
        void serialize(Archive& ar, unsigned long version)
        {
            ar & soapclient::make_nvp("id", id);
        }
    } request;

    template<typename Archive>
    void serialize(Archive& ar, unsigned long version)
    {
        ar & soapclient::make_nvp("retrieve", request);
    }
};

struct retrieve_response
{
    struct result
    {
        Cart cart;

        template<typename Archive>
        void serialize(Archive& ar, unsigned long version)
        {
            ar & soapclient::make_nvp("cart", cart);
        }
    } response;

    template<typename Archive>
    void serialize(Archive& ar, unsigned long version)
    {
        ar & soapclient::make_nvp("retrieveResponse", response);
    }
};
//]

//[ cart_main
int main()
{
    soapclient::soap::client_config config;
    config.url = "http://localhost:8080/ws";
    config.name_space = "http://example.com/cart";
    config.user_agent = SOAPCLIENT_DEFAULT_USER_AGENT;

    soapclient::soap::client client(config);

    try
    {
        create create_request{ { "maarten" } };
        create_response created;
        client.round_trip(create_request, created);

        retrieve_cart retrieve_request{ { created.response.id } };
        retrieve_response retrieved;
        client.round_trip(retrieve_request, retrieved);

        std::cout << "cart " << retrieved.response.cart.id << " for " << retrieved.response.cart.client
                  << " has " << retrieved.response.cart.items.size() << " items" << std::endl;
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
//]
