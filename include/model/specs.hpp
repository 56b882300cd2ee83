#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace lazyserve::model {

// Everything the serve command needs, from the config file and the command line.
struct ServeSpec {
    std::string host = "0.0.0.0";
    int port = 3000;
    std::filesystem::path serveDir;
    std::filesystem::path watchDir;
    std::string indexFile = "index.html";
    std::vector<std::filesystem::path> ignore;
    std::string command;
    bool openBrowser = false;
    bool verbose = false;
};

} // namespace lazyserve::model
