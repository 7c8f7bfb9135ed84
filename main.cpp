#include <wireheaders/wireheaders.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

static std::string normalizeLineEndings(const std::string& text) {
  // Header dumps saved on disk often lost their CR.
  std::string result;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) result += '\r';
    result += text[i];
  }
  return result;
}

int main (int argc, char* argv[]) {
  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " <header block file (optional = stdin)>" << std::endl;
    return 1;
  }

  std::string raw;
  if (argc == 2) {
    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
      std::cerr << "Cannot open " << argv[1] << std::endl;
      return 1;
    }
    raw.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  } else {
    std::ostringstream input;
    input << std::cin.rdbuf();
    raw = input.str();
  }

  wireheaders::Headers headers = wireheaders::Headers::parse(normalizeLineEndings(raw));

  std::cout << "Headers:" << std::endl;
  std::cout << headers.dump() << std::endl;

  std::cout << "Connection: close          " << (headers.connectionClose() ? "yes" : "no") << std::endl;
  std::cout << "Transfer-Encoding: chunked " << (headers.transferEncodingChunked() ? "yes" : "no") << std::endl;
  std::cout << "Expect: 100-continue       " << (headers.expectContinue() ? "yes" : "no") << std::endl;

  std::vector<std::string> cookies = headers.setCookies();
  if (!cookies.empty()) {
    std::cout << std::endl << "Cookies:" << std::endl;
    for (const std::string& cookie : cookies) {
      std::cout << "  " << cookie << std::endl;
    }
  }

  return 0;
}
