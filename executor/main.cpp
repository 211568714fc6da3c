#include <exgroup/group/exception_group.h>
#include <exgroup/log/log.h>

#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

struct job_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct timeout_error : job_error {
    using job_error::job_error;
};

// 并行执行 jobs，收集失败的异常
exgroup::exception_group run_jobs(const std::vector<std::function<void()>>& jobs) {
    std::mutex mtx;
    std::vector<std::exception_ptr> exceptions;
    std::vector<std::string> sources;

    std::vector<std::thread> threads;
    threads.reserve(jobs.size());
    for (size_t i = 0; i < jobs.size(); ++i) {
        threads.emplace_back([&, i] {
            try {
                jobs[i]();
            } catch (const std::exception&) {
                std::lock_guard lock(mtx);
                exceptions.emplace_back(std::current_exception());
                sources.emplace_back(fmt::format("job {}", i));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    return exgroup::exception_group::create(fmt::format("{} of {} jobs failed", exceptions.size(), jobs.size()),
                                            std::move(exceptions), std::move(sources));
}

}  // namespace

int main(int argc, char** argv) {
    if (argc > 1 && !exgroup::load_log_config(argv[1])) {
        exgroup::warn("log config {} not loaded, use default logger", argv[1]);
    }

    exgroup::register_error_kind<job_error, std::runtime_error>("job_error");
    exgroup::register_error_kind<timeout_error, job_error>("timeout_error");

    const auto& family = exgroup::group_family::default_family();
    const auto only_jobs = family.specialize({exgroup::kind_of<job_error>()});
    const auto any_logic = family.specialize({exgroup::kind_of<std::logic_error>(), exgroup::open_marker});

    const std::vector<std::function<void()>> jobs{
        [] {},
        [] { throw timeout_error("no reply in 3s"); },
        [] { throw std::invalid_argument("negative size"); },
        [] { throw job_error("exit code 2"); },
    };

    try {
        throw run_jobs(jobs);
    } catch (const exgroup::exception_group& group) {
        exgroup::info("{}: {}", group.message(), group);
        for (size_t i = 0; i < group.exceptions().size(); ++i) {
            exgroup::info("  {} -> {}", group.sources()[i], *group.member_kinds()[i]);
        }

        if (group.matches(only_jobs)) {
            exgroup::info("handled by {}", *only_jobs);
        } else if (group.matches(any_logic)) {
            exgroup::info("handled by {}", *any_logic);
        } else {
            exgroup::error("unhandled {}", *group.kind());
            return 1;
        }
    } catch (const std::system_error& e) {
        exgroup::error("{} ({})", e.what(), e.code().message());
        return 1;
    }

    exgroup::log_flush();
    return 0;
}
