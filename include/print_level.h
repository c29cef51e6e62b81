// Dedicated header for PrintLevel to avoid circular dependencies.
#ifndef PRINT_LEVEL_H
#define PRINT_LEVEL_H
struct PrintLevel {
  int level = 0;        // Debug level: -1=quiet, 0=normal, 1+=debug
  bool quiet = false;   // Suppress progress messages (level < 0)
  bool debug = false;   // Print header dumps on failures (level >= 1)
  bool debug2 = false;  // Print per-row classification (level >= 2)
};

inline PrintLevel make_print_level(int debug_level) {
  return PrintLevel{debug_level, debug_level < 0, debug_level >= 1,
                    debug_level >= 2};
}
#endif  // PRINT_LEVEL_H
