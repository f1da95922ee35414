#ifndef FINITE_DOMAIN_SEARCH_GUARD_FDS_FDS_HH
#define FINITE_DOMAIN_SEARCH_GUARD_FDS_FDS_HH 1

#include <fds/assignment.hh>
#include <fds/backtracking_solver.hh>
#include <fds/constraint.hh>
#include <fds/csp.hh>
#include <fds/domain.hh>
#include <fds/exception.hh>
#include <fds/inference.hh>
#include <fds/min_conflicts_solver.hh>
#include <fds/search_heuristics.hh>
#include <fds/solver.hh>
#include <fds/stats.hh>
#include <fds/tree_csp_solver.hh>
#include <fds/value.hh>
#include <fds/variable_id.hh>

#include <fds/constraints/all_different.hh>
#include <fds/constraints/equals.hh>
#include <fds/constraints/not_equals.hh>
#include <fds/constraints/predicate.hh>

#endif
