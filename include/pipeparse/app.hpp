#pragma once

namespace pipeparse {

class App {
public:
  int run(int argc, char **argv);
};

} // namespace pipeparse
