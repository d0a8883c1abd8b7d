#include "Vernum.hpp"

int
main(int argc, char* argv[]) {
  return vernum::vernumMain(argc, argv).is_err();
}
