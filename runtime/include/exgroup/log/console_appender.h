#pragma once
#include <exgroup/log/appender.h>

#include <cstdio>

namespace exgroup {

class console_appender : public log_appender {
  public:
    EXGROUP_API explicit console_appender(FILE *target_file);

    ~console_appender() noexcept override = default;

    EXGROUP_NON_COPYABLE(console_appender)

  protected:
    EXGROUP_API void write(log_level level, const log_buf_t &buf, size_t color_start, size_t color_stop) override;

    EXGROUP_API void flush_unlock() override;

  private:
    void write_strv(const std::string_view &strv);

    FILE *file_;
    bool enable_color_;
};

class stdout_appender final : public console_appender {
  public:
    EXGROUP_API stdout_appender();
};

class stderr_appender final : public console_appender {
  public:
    EXGROUP_API stderr_appender();
};

}  // namespace exgroup
