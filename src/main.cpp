#include "view/cli.hpp"

int main() {
  CLI cli;
  return cli.run();
}
