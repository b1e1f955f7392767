#include "tool/process_exit.hpp"

#include "log/log.hpp"

#include <cstdlib>
#include <iostream>

namespace cltk::tool {

ProcessExit::ProcessExit() : handler_([](int code) { std::exit(code); }) {}

ProcessExit::ProcessExit(Handler handler) : handler_(std::move(handler)) {}

void ProcessExit::operator()(ExecutionStatus status) const {
    const int code = to_exit_code(status);
    CLTK_LOG_INFO("lifecycle", "exiting with " << status_name(status) << " (" << code << ")");

    log::Logger::instance().flush();
    std::cout.flush();
    std::cerr.flush();

    if (handler_) {
        handler_(code);
    }
    std::exit(code);
}

} // namespace cltk::tool
