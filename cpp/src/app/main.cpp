// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Создание системного Opener
// 2. app::run: парсинг argv, Writer, dispatch
// 3. Возврат exit code
//
// Исключения перехватываются только здесь, на границе процесса.
//
// ==============================================================================

#include "openhtml/app.hpp"
#include "openhtml/launcher.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        openhtml::launch::SystemOpener opener;
        return openhtml::app::run(argc, argv, opener);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
