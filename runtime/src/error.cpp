#include <exgroup/error.h>
#include <fmt/format.h>

#include <string>

namespace exgroup {

class group_category final : public std::error_category {
  public:
    [[nodiscard]] const char* name() const noexcept override { return "exgroup.group"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<group_errors>(value)) {
            case group_errors::invalid_specialization:
                return "invalid specialization";
            case group_errors::empty_specialization:
                return "specialization does not match empty exceptions";
            case group_errors::invalid_member:
                return "expected an exception object";
            case group_errors::source_count_mismatch:
                return "different number of sources and exceptions";
            default:  // NOLINT(clang-diagnostic-covered-switch-default)
                return "exgroup.group error";
        }
    }
};

const std::error_category& get_group_category() {
    static group_category category;
    return category;
}

source_count_mismatch_error::source_count_mismatch_error(size_t sources, size_t exceptions)
    : std::system_error(group_errors::source_count_mismatch,
                        fmt::format("different number of sources ({}) and exceptions ({})", sources, exceptions)),
      sources_(sources),
      exceptions_(exceptions) {}

}  // namespace exgroup
