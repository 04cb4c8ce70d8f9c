#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "app.hpp"
#include <exception>
#include <iostream>

int main() {
  try {
    Terminal term;
    {
      NcursesTerminal nterm;
      App app(nterm);
      app.run();
    }
    term.close();
  } catch (const std::exception& e) {
    std::cerr << "typetest: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
