#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include <iostream>
#include <string>

/**
 * @brief Operator-facing progress output.
 *
 * Progress lines go to @a out and can be silenced; error lines go to @a err
 * and result lines always reach @a out. Colors are ANSI escapes and can be
 * switched off.
 */
class Console {
  public:
    Console(std::ostream& out = std::cout, std::ostream& err = std::cerr, bool colors = true,
            bool silent = false);

    /// Green banner line such as `=== GitHub Repo Creation ===`.
    void banner(const std::string& title);
    /// Yellow "doing something..." line.
    void step(const std::string& msg);
    /// Green `✓ msg` line.
    void ok(const std::string& msg);
    /// Indented `  ✓ msg` line used inside a step.
    void item(const std::string& msg);
    void note(const std::string& msg);
    void warn(const std::string& msg);
    void plain(const std::string& msg = {});
    /// Red line on the error stream; never silenced.
    void error(const std::string& msg);
    /// Uncolored line on the output stream; never silenced.
    void result(const std::string& msg);

    bool colors() const { return colors_; }
    bool silent() const { return silent_; }

  private:
    void emit(const char* color, const std::string& msg);

    std::ostream& out_;
    std::ostream& err_;
    bool colors_;
    bool silent_;
};

#endif // CONSOLE_HPP
