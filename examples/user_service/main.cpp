#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/exception/diagnostic_information.hpp>

#include <cppinject/Container.hpp>

#include "Services.hpp"

int main(int argc, char* argv[])
{
    const std::string package = argc > 1 ? argv[1] : "example.valid";

    try
    {
        const cppinject::ComponentCatalog catalog = example::makeCatalog();

        cppinject::Container container;
        container.scan(catalog, package);

        std::cout << "==================== APPLICATION STARTED ====================" << std::endl;

        auto userService = container.getInstance<example::UserService>();
        std::cout << "Getting user with id 1.." << std::endl;
        std::cout << userService->getUser(1) << std::endl;
        std::cout << "Creating a new user.." << std::endl;
        std::cout << userService->createUser("test", "testi@toto.com") << std::endl;
    }
    catch (const cppinject::InjectException& e)
    {
        std::cerr << "error: " << cppinject::messageOf(e) << std::endl;
        std::cerr << boost::diagnostic_information(e) << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
