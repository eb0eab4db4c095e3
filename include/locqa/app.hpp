#pragma once

namespace locqa {

class App {
public:
  // Exit codes: 0 success, 1 operation failure, 2 usage error.
  int run(int argc, char **argv);
};

} // namespace locqa
