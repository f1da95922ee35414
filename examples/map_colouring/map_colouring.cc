#include <fds/fds.hh>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

using namespace fds;

using std::cerr;
using std::cout;
using std::make_unique;
using std::nullopt;
using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;

using fmt::print;

namespace
{
    auto australia(CSP & csp) -> void
    {
        Domain colours{"RED"_v, "GREEN"_v, "BLUE"_v};
        auto wa = csp.create_variable(colours, "WA");
        auto nt = csp.create_variable(colours, "NT");
        auto q = csp.create_variable(colours, "Q");
        auto nsw = csp.create_variable(colours, "NSW");
        auto v = csp.create_variable(colours, "V");
        auto sa = csp.create_variable(colours, "SA");
        csp.create_variable(colours, "T");

        csp.post(NotEquals{wa, sa});
        csp.post(NotEquals{wa, nt});
        csp.post(NotEquals{nt, sa});
        csp.post(NotEquals{nt, q});
        csp.post(NotEquals{sa, q});
        csp.post(NotEquals{sa, nsw});
        csp.post(NotEquals{sa, v});
        csp.post(NotEquals{q, nsw});
        csp.post(NotEquals{nsw, v});
    }

    auto tree(CSP & csp) -> void
    {
        Domain colours{"RED"_v, "GREEN"_v, "BLUE"_v};
        auto v0 = csp.create_variable(colours, "V0");
        auto v1 = csp.create_variable(colours, "V1");
        auto v2 = csp.create_variable(Domain{"RED"_v}, "V2");
        auto v3 = csp.create_variable(colours, "V3");
        auto v4 = csp.create_variable(Domain{"GREEN"_v}, "V4");
        auto v5 = csp.create_variable(colours, "V5");
        auto v6 = csp.create_variable(Domain{"RED"_v}, "V6");
        auto v7 = csp.create_variable(Domain{"BLUE"_v}, "V7");

        csp.post(NotEquals{v0, v1});
        csp.post(NotEquals{v1, v2});
        csp.post(NotEquals{v1, v3});
        csp.post(NotEquals{v1, v4});
        csp.post(NotEquals{v3, v5});
        csp.post(NotEquals{v5, v6});
        csp.post(NotEquals{v5, v7});
    }

    auto find_variable(const CSP & csp, const string & name) -> VariableID
    {
        for (auto & v : csp.variables())
            if (csp.name_of(v) == name)
                return v;
        throw UnexpectedException{"no variable named " + name};
    }

    auto build_map(const string & map, CSP & csp) -> bool
    {
        if (map == "tree") {
            tree(csp);
            return true;
        }

        australia(csp);
        if (map == "australia")
            return true;
        else if (map == "australia-nsw-blue") {
            csp.set_domain(find_variable(csp, "NSW"), Domain{"BLUE"_v});
            return true;
        }
        else if (map == "australia-wa-red") {
            csp.set_domain(find_variable(csp, "WA"), Domain{"RED"_v});
            return true;
        }

        return false;
    }

    auto build_solver(const string & strategy, unsigned long long steps, optional<unsigned> seed) -> unique_ptr<CspSolver>
    {
        if (strategy == "min-conflicts")
            return make_unique<MinConflictsSolver>(steps, seed);
        else if (strategy == "tree")
            return make_unique<TreeCspSolver>(RootSelection::FirstVariable, seed);
        else if (strategy == "tree-random")
            return make_unique<TreeCspSolver>(RootSelection::Random, seed);

        auto solver = make_unique<FlexibleBacktrackingSolver>();
        if (strategy == "deg")
            solver->set(variable_order::deg());
        else if (strategy == "fc")
            solver->set(inference::forward_checking());
        else if (strategy == "fc-mrv")
            solver->set(variable_order::dom_then_deg()).set(inference::forward_checking());
        else if (strategy == "fc-lcv")
            solver->set(value_order::least_constraining()).set(inference::forward_checking());
        else if (strategy == "ac3")
            solver->set(inference::arc_consistency());
        else if (strategy == "all")
            solver->set_all();
        else if (strategy != "backtracking")
            return nullptr;

        return solver;
    }
}

auto main(int argc, char * argv[]) -> int
{
    cxxopts::Options options("Program options");
    cxxopts::ParseResult options_vars;

    try {
        options.add_options("Program options")
            ("help", "Display help information")
            ("trace", "Print every step of the search")
            ("map", "Which map to colour (australia, australia-nsw-blue, australia-wa-red, tree)",
                cxxopts::value<string>()->default_value("australia"))
            ("strategy", "How to solve it (backtracking, deg, fc, fc-mrv, fc-lcv, ac3, all, min-conflicts, tree, tree-random)",
                cxxopts::value<string>()->default_value("backtracking"))
            ("steps", "Step budget for min-conflicts", cxxopts::value<unsigned long long>()->default_value("50"))
            ("seed", "Random seed for min-conflicts and tree-random", cxxopts::value<unsigned>());

        options_vars = options.parse(argc, argv);
    }
    catch (const cxxopts::exceptions::exception & e) {
        print(cerr, "Error: {}\n", e.what());
        print(cerr, "Try {} --help\n", argv[0]);
        return EXIT_FAILURE;
    }

    if (options_vars.contains("help")) {
        print("Usage: {} [options]\n", argv[0]);
        print("\n");
        cout << options.help() << std::endl;
        return EXIT_SUCCESS;
    }

    CSP csp;
    auto map = options_vars["map"].as<string>();
    if (! build_map(map, csp)) {
        print(cerr, "Unknown map {}\n", map);
        return EXIT_FAILURE;
    }

    auto strategy = options_vars["strategy"].as<string>();
    auto solver = build_solver(strategy, options_vars["steps"].as<unsigned long long>(),
        options_vars.contains("seed") ? optional<unsigned>{options_vars["seed"].as<unsigned>()} : nullopt);
    if (! solver) {
        print(cerr, "Unknown strategy {}\n", strategy);
        return EXIT_FAILURE;
    }

    if (options_vars.contains("trace")) {
        unsigned long long step = 0;
        solver->add_listener([&](const CSP & problem, const optional<VariableID> & var, const Assignment * assignment) -> bool {
            ++step;
            if (assignment)
                print("Step {}: Assignment changed{} {}{}\n", step,
                    var ? " at " + problem.name_of(*var) : string{}, describe(problem, *assignment),
                    assignment->is_solution(problem) ? " (Solution)" : "");
            else
                print("Step {}: Domain reduced{}\n", step, var ? " at " + problem.name_of(*var) : string{});
            return true;
        });
    }

    optional<Assignment> solution;
    try {
        solution = solver->solve(csp);
    }
    catch (const StructuralError & e) {
        print("Structural error: {}\n", e.what());
        print("{}", solver->stats());
        return EXIT_FAILURE;
    }

    if (solution)
        print("Solution: {}\n", describe(csp, *solution));
    else
        print("No solution found\n");

    print("{}", solver->stats());

    return EXIT_SUCCESS;
}
