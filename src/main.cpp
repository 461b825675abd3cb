#include "FinanceApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
FinanceApp* g_app = nullptr;

void signalHandler(int signal)
{
    std::cerr << "\n[main] Received signal " << signal << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
}

int main()
{
    // stdout отдаётся под ответы на команды, журнал уходит в stderr
    std::ostream replies(std::cout.rdbuf());
    std::cout.rdbuf(std::cerr.rdbuf());

    try
    {
        FinanceApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Finance Tracker Starting" << std::endl;
        std::cout << "  One JSON command per line, EOF to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run(std::cin, replies);
        g_app = nullptr;

        std::cout << "  Finance Tracker Stopped" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
