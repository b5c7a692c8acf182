#include <iostream>

#include <pk3/pk3.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.pk3>\n";
    return 1;
  }

  std::string error;
  auto archive = pk3::Reader::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Files: " << archive->fileCount() << "\n\n";

  for (const auto &file : archive->files()) {
    const char *method = file.method == pk3::zip::methodDeflate  ? "deflate"
                         : file.method == pk3::zip::methodStored ? "stored"
                                                                 : "other";
    std::cout << "  " << file.path << " (" << file.size << " bytes, " << method << ")\n";
  }

  return 0;
}
