#include "hintgraph/common/graph_builder.hpp"
#include "hintgraph/common/logging.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace hintgraph;

namespace
{

/// Parse a positional argument as a Value.
Value parse_value(const std::string& text)
{
    size_t consumed = 0;
    unsigned long parsed = std::stoul(text, &consumed);
    if (consumed != text.size() || parsed > std::numeric_limits<Value>::max())
    {
        throw std::invalid_argument("not a 32-bit unsigned value: " + text);
    }
    return static_cast<Value>(parsed);
}

} // namespace

// Usage: hintgraph_demo [--verbose] [x [sqrt_hint]]
// Proves that sqrt_hint is the square root of x + 7.
int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== hintgraph ======\n" << std::flush;

        std::vector<std::string> positional;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--verbose")
            {
                set_log_level(spdlog::level::trace);
            }
            else
            {
                positional.push_back(arg);
            }
        }
        Value x_value = positional.size() > 0 ? parse_value(positional[0]) : 9;
        Value hint_value = positional.size() > 1 ? parse_value(positional[1]) : 4;

        GraphBuilder builder({OverflowPolicy::Checked, /*log_construction=*/true});
        NodeIdx x = builder.init();
        NodeIdx seven = builder.constant(7);
        NodeIdx x_plus_seven = builder.add(x, seven);
        NodeIdx sqrt_x_plus_seven = builder.hint(hint_value, x_plus_seven);
        NodeIdx computed_sq = builder.multiply(sqrt_x_plus_seven, sqrt_x_plus_seven);

        // Only constants and hints have outputs before filling
        fmt::print("graph before filling:\n{}\n\n", builder);
        builder.fill_nodes(x, x_value);
        fmt::print("graph after filling x = {}:\n{}\n\n", x_value, builder);

        fmt::print("{}\n", builder.get_node(x_plus_seven));
        fmt::print("constraints hold: {}\n", builder.check_constraints());
        fmt::print("hint equality holds: {}\n",
                   builder.assert_equal(sqrt_x_plus_seven, computed_sq));

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
