#ifndef SOLVER_H
#define SOLVER_H

#include <cstdint>

extern "C"
{
  int sudocore_solver_full(const char *in81, char *out81, char *alt81);

  int sudocore_solver_count(const char *in81, int limit);

  void sudocore_set_log_level(int level);
} // extern "C"

#endif // SOLVER_H
