#include <gtest/gtest.h>
#include <job_system/job_system.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

enum class TestJobType {
    RENDER,
    PERSIST
};

class JobSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        job_system = std::make_unique<job_system::JobSystem<TestJobType>>(4);
    }

    void TearDown() override {
        job_system->shutdown();
        job_system.reset();
    }

    std::unique_ptr<job_system::JobSystem<TestJobType>> job_system;
};

TEST_F(JobSystemTest, BasicJobExecution) {
    std::atomic<int> counter{0};

    job_system->start();

    auto job = job_system::make_job([&counter]() {
        counter.fetch_add(1);
    }, TestJobType::RENDER);

    job_system->submit(std::move(job));
    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), 1);
}

TEST_F(JobSystemTest, MultipleJobsExecution) {
    std::atomic<int> counter{0};
    const int num_jobs = 200;

    job_system->start();

    for (int i = 0; i < num_jobs; ++i) {
        job_system->submit_function([&counter]() {
            counter.fetch_add(1);
        }, TestJobType::RENDER);
    }

    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), num_jobs);
    EXPECT_EQ(job_system->get_pending_count(), 0u);
    EXPECT_EQ(job_system->get_statistics().total_jobs_executed, static_cast<size_t>(num_jobs));
}

TEST_F(JobSystemTest, EachJobWritesOwnSlot) {
    const size_t num_slots = 64;
    std::vector<int> slots(num_slots, -1);

    job_system->start();

    for (size_t i = 0; i < num_slots; ++i) {
        job_system->submit_function([&slots, i]() {
            slots[i] = static_cast<int>(i * i);
        }, TestJobType::RENDER, job_system::ScheduleMode::FIFO);
    }

    job_system->wait_for_completion();

    for (size_t i = 0; i < num_slots; ++i) {
        EXPECT_EQ(slots[i], static_cast<int>(i * i));
    }
}

TEST_F(JobSystemTest, WaitWithNoJobsReturnsImmediately) {
    job_system->start();
    job_system->wait_for_completion();
    EXPECT_EQ(job_system->get_pending_count(), 0u);
    EXPECT_FALSE(job_system->has_error());
}

TEST_F(JobSystemTest, SubmitBeforeStartThrows) {
    EXPECT_THROW(job_system->submit_function([]() {}, TestJobType::RENDER), std::runtime_error);
}

TEST_F(JobSystemTest, FirstExceptionIsCapturedAndOthersStillRun) {
    std::atomic<int> counter{0};

    job_system->start();

    job_system->submit_function([]() {
        throw std::runtime_error("pair failed");
    }, TestJobType::PERSIST);

    for (int i = 0; i < 20; ++i) {
        job_system->submit_function([&counter]() {
            counter.fetch_add(1);
        }, TestJobType::RENDER);
    }

    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), 20);
    EXPECT_TRUE(job_system->has_error());
    EXPECT_EQ(job_system->get_error_type(), job_system::ErrorType::Exception);
    ASSERT_TRUE(job_system->first_error().has_value());
    EXPECT_EQ(*job_system->first_error(), "pair failed");
    EXPECT_EQ(job_system->get_failed_count(), 1u);

    job_system->clear_error();
    EXPECT_FALSE(job_system->has_error());
    EXPECT_FALSE(job_system->first_error().has_value());
}

TEST_F(JobSystemTest, IdleWorkersStealQueuedJobs) {
    std::atomic<int> counter{0};
    std::mutex ids_mutex;
    std::vector<std::thread::id> ids;

    job_system->start();

    // Enough slow jobs that idle workers find queues to steal from
    for (int i = 0; i < 64; ++i) {
        job_system->submit_function([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            counter.fetch_add(1);
            std::lock_guard<std::mutex> lock(ids_mutex);
            ids.push_back(std::this_thread::get_id());
        }, TestJobType::RENDER);
    }

    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), 64);
    auto stats = job_system->get_statistics();
    EXPECT_EQ(stats.total_jobs_executed, 64u);
    EXPECT_EQ(stats.total_jobs_failed, 0u);
}

TEST_F(JobSystemTest, RestartAfterShutdown) {
    std::atomic<int> counter{0};

    job_system->start();
    job_system->submit_function([&counter]() { counter.fetch_add(1); }, TestJobType::RENDER);
    job_system->wait_for_completion();
    job_system->shutdown();
    EXPECT_FALSE(job_system->is_running());

    job_system->start();
    job_system->submit_function([&counter]() { counter.fetch_add(1); }, TestJobType::RENDER);
    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), 2);
}

TEST(JobSystemConstruction, ZeroThreadsUsesAtLeastOneWorker) {
    job_system::JobSystem<TestJobType> system(0);
    EXPECT_GE(system.get_num_workers(), 1u);
}
