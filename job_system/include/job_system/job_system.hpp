#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace job_system {

// Kind of the first exception that escaped a job
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

/**
 * Work-stealing worker pool.
 *
 * One deque per worker; submissions are distributed round-robin and idle
 * workers steal half of a random victim's queue. Jobs are expected not to
 * throw. If one does, the pool keeps running the remaining jobs and records
 * the first failure, which callers inspect after wait_for_completion().
 */
template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<size_t> jobs_executed{0};
        std::atomic<size_t> jobs_executing{0};
        std::atomic<size_t> jobs_stolen{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};
    size_t num_threads_;

    std::atomic<size_t> total_submitted_{0};
    std::atomic<size_t> total_completed_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    // First failure wins; later ones only bump the counter
    std::mutex error_mutex_;
    ErrorType error_type_ = ErrorType::None;
    std::string error_message_;
    std::atomic<size_t> failed_jobs_{0};

    void record_failure(ErrorType type, const std::string& message) {
        failed_jobs_.fetch_add(1);
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (error_type_ == ErrorType::None) {
            error_type_ = type;
            error_message_ = message;
        }
    }

    // Try to steal half the tasks from a victim worker
    std::vector<JobPtr<JobType>> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr<JobType>> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        size_t steal_count = std::max(size_t(1), victim->tasks.size() / 2);
        stolen.reserve(steal_count);

        for (size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }

        return stolen;
    }

    void run_job(WorkerData* data, JobPtr<JobType> job) {
        data->jobs_executing.fetch_add(1);

        try {
            job->execute();
        } catch (const std::bad_alloc&) {
            record_failure(ErrorType::OutOfMemory, "out of memory");
        } catch (const std::exception& e) {
            record_failure(ErrorType::Exception, e.what());
        } catch (...) {
            record_failure(ErrorType::Unhandled, "non-standard exception");
        }

        data->jobs_executing.fetch_sub(1);
        data->jobs_executed.fetch_add(1);

        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            total_completed_.fetch_add(1);
        }
        completion_cv_.notify_all();
    }

    void worker_loop(WorkerData* data) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<size_t> dist(0, workers_.size() - 1);

        while (true) {
            JobPtr<JobType> job;

            {
                std::unique_lock<std::mutex> lock(data->mutex);

                if (data->tasks.empty() && !data->stop.load()) {
                    lock.unlock();

                    for (size_t attempt = 0; attempt < workers_.size(); ++attempt) {
                        auto* victim = workers_[dist(gen)].get();
                        if (victim == data) continue;

                        auto stolen = try_steal_from(victim);
                        if (!stolen.empty()) {
                            std::lock_guard<std::mutex> local_lock(data->mutex);
                            for (auto& stolen_job : stolen) {
                                data->tasks.push_back(std::move(stolen_job));
                            }
                            data->jobs_stolen.fetch_add(stolen.size());
                            break;
                        }
                    }

                    lock.lock();
                }

                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                if (data->stop.load() && data->tasks.empty()) {
                    break;
                }

                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.back());
                    data->tasks.pop_back();
                }
            }

            if (job) {
                run_job(data, std::move(job));
            }
        }
    }

public:
    explicit JobSystem(size_t num_threads = 0)
        : num_threads_(num_threads == 0 ? std::thread::hardware_concurrency() : num_threads) {
        if (num_threads_ == 0) num_threads_ = 1;

        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    ~JobSystem() {
        shutdown();
    }

    void start() {
        if (is_running_.load()) return;

        total_submitted_.store(0);
        total_completed_.store(0);
        clear_error();

        for (auto& worker : workers_) {
            worker->stop.store(false);
            auto* data = worker.get();
            data->thread = std::thread([this, data] {
                worker_loop(data);
            });
        }

        is_running_.store(true);
    }

    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop.store(true);
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        total_submitted_.fetch_add(1);

        size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        auto* worker = workers_[worker_idx].get();

        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (mode == ScheduleMode::LIFO) {
                worker->tasks.push_back(std::move(job));
            } else {
                worker->tasks.push_front(std::move(job));
            }
        }
        worker->cv.notify_one();
    }

    template<typename F>
    void submit_function(F&& func, JobType job_type, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), job_type), mode);
    }

    // Blocks until every submitted job has finished executing
    void wait_for_completion() {
        std::unique_lock<std::mutex> lock(completion_mutex_);
        completion_cv_.wait(lock, [this] {
            return total_submitted_.load() == total_completed_.load();
        });
    }

    size_t get_num_workers() const {
        return workers_.size();
    }

    size_t get_pending_count() const {
        size_t submitted = total_submitted_.load(std::memory_order_relaxed);
        size_t completed = total_completed_.load(std::memory_order_relaxed);
        return submitted > completed ? submitted - completed : 0;
    }

    bool is_running() const {
        return is_running_.load();
    }

    ErrorType get_error_type() {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return error_type_;
    }

    bool has_error() {
        return get_error_type() != ErrorType::None;
    }

    // what() of the first escaped exception, if any
    std::optional<std::string> first_error() {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (error_type_ == ErrorType::None) return std::nullopt;
        return error_message_;
    }

    size_t get_failed_count() const {
        return failed_jobs_.load();
    }

    void clear_error() {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_type_ = ErrorType::None;
        error_message_.clear();
        failed_jobs_.store(0);
    }

    const char* get_error_description() {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    struct SystemStatistics {
        size_t total_jobs_executed;
        size_t total_jobs_stolen;
        size_t total_jobs_failed;
    };

    SystemStatistics get_statistics() const {
        size_t total_executed = 0;
        size_t total_stolen = 0;
        for (const auto& worker : workers_) {
            total_executed += worker->jobs_executed.load();
            total_stolen += worker->jobs_stolen.load();
        }
        return SystemStatistics{total_executed, total_stolen, failed_jobs_.load()};
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
