#include <gtest/gtest.h>

#include <iostream>

// Main function for running all tests
int main(int argc, char* argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  std::cout << "Running csvcmp unit tests..." << std::endl;

  return RUN_ALL_TESTS();
}
