#include "BankApp.hpp"
#include <iostream>

int main()
{
    try
    {
        bank::BankApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Bank CLI Starting" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run();

        std::cout << "========================================" << std::endl;
        std::cout << "  Bank CLI Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
