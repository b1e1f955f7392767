#include "args/argument_binder.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

using namespace cltk;
using namespace cltk::args;

namespace {

struct ServeOptions {
    int port = 80;
    std::string host = "localhost";
    std::string address;
    std::vector<std::string> files;
    std::vector<std::string> order;
};

} // namespace

class ArgumentBinderTest : public ::testing::Test {
protected:
    ArgumentParser parser{"cltk serve", "[--port=<n>] <files...>", "Serve files"};
    ArgumentBinder<ServeOptions> binder;
};

TEST_F(ArgumentBinderTest, FieldBindingsCopyPresentValues) {
    auto port = parser.add_option<int>("--port");
    auto files = parser.add_positional<std::vector<std::string>>("files", "", true);
    binder.bind(port, &ServeOptions::port);
    binder.bind(files, &ServeOptions::files);

    ServeOptions options;
    binder.fill(parser.parse({"--port=8080", "a.html", "b.css"}), options);

    EXPECT_EQ(options.port, 8080);
    EXPECT_EQ(options.files, (std::vector<std::string>{"a.html", "b.css"}));
    EXPECT_EQ(binder.size(), 2u);
}

TEST_F(ArgumentBinderTest, AbsentValuesLeaveDefaults) {
    auto port = parser.add_option<int>("--port");
    binder.bind(port, &ServeOptions::port);

    ServeOptions options;
    binder.fill(parser.parse({}), options);
    EXPECT_EQ(options.port, 80);
}

TEST_F(ArgumentBinderTest, CallbacksRunInRegistrationOrder) {
    auto host = parser.add_option<std::string>("--host");
    auto port = parser.add_option<int>("--port");
    binder.bind(port, [](ServeOptions& o, int value) {
        o.port = value;
        o.order.push_back("port");
    });
    binder.bind(host, [](ServeOptions& o, std::string value) {
        o.host = std::move(value);
        o.order.push_back("host");
    });

    ServeOptions options;
    binder.fill(parser.parse({"--host=example.org", "--port=1"}), options);

    EXPECT_EQ(options.host, "example.org");
    EXPECT_EQ(options.order, (std::vector<std::string>{"port", "host"}));
}

TEST_F(ArgumentBinderTest, PairBindingRunsWhenEitherIsPresent) {
    auto host = parser.add_option<std::string>("--host");
    auto port = parser.add_option<int>("--port");
    binder.bind(host, port,
                [](ServeOptions& o, std::optional<std::string> h, std::optional<int> p) {
                    o.address = h.value_or("*") + ":" + std::to_string(p.value_or(0));
                });

    ServeOptions only_port;
    binder.fill(parser.parse({"--port=9"}), only_port);
    EXPECT_EQ(only_port.address, "*:9");

    ServeOptions neither;
    binder.fill(parser.parse({}), neither);
    EXPECT_EQ(neither.address, "");
}

TEST_F(ArgumentBinderTest, CallbackMayRejectValue) {
    auto port = parser.add_option<int>("--port");
    binder.bind(port, [](ServeOptions& o, int value) {
        if (value <= 0 || value > 65535) {
            throw BindingError("port " + std::to_string(value) + " is out of range");
        }
        o.port = value;
    });

    ServeOptions options;
    EXPECT_THROW(binder.fill(parser.parse({"--port=70000"}), options), BindingError);
}
