#include "terminal.hpp"
#include "editor.hpp"
#include <filesystem>
#include <vector>

int main(int argc, char** argv) {
  std::vector<std::filesystem::path> files;
  for (int i = 1; i < argc; ++i) files.emplace_back(argv[i]);
  Terminal term;
  Editor ed(files);
  ed.run();
  return 0;
}
