#include <iostream>

#include "app/trace_app.hpp"


int main(int argc, char** argv) {
  return optray::RunTrace(argc, argv, std::cout);
}
