#ifndef JOB_SYSTEM_JOB_HPP
#define JOB_SYSTEM_JOB_HPP

#include <memory>
#include <type_traits>
#include <utility>

namespace job_system {

template<typename JobType>
class Job {
public:
    virtual ~Job() = default;

    virtual void execute() = 0;
    virtual JobType get_type() const = 0;
};

template<typename JobType, typename Func>
class FunctionJob : public Job<JobType> {
private:
    Func function_;
    JobType type_;

public:
    template<typename F>
    FunctionJob(F&& func, JobType type)
        : function_(std::forward<F>(func)), type_(type) {}

    void execute() override {
        static_assert(std::is_invocable_v<Func>, "Function must be callable");
        function_();
    }

    JobType get_type() const override {
        return type_;
    }
};

template<typename JobType, typename Func>
auto make_job(Func&& func, JobType type) {
    return std::make_unique<FunctionJob<JobType, std::decay_t<Func>>>(
        std::forward<Func>(func), type);
}

template<typename JobType>
using JobPtr = std::unique_ptr<Job<JobType>>;

enum class ScheduleMode {
    LIFO,  // Last In, First Out (cache-friendly for related tasks)
    FIFO   // First In, First Out (fair scheduling)
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_HPP
