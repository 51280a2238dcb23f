#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace WordleChain {

	// Fixed worker pool used by the host to push notifications to subscribers
	// off the request thread. The engine itself never runs on it.
	class TaskQueue {
	public:
		explicit TaskQueue(size_t numWorkers = std::thread::hardware_concurrency(), std::string name = "TaskQueue");
		~TaskQueue();

		TaskQueue(const TaskQueue&) = delete;
		TaskQueue& operator=(const TaskQueue&) = delete;

		void enqueue(std::function<void()> task);

		// Blocks until the queue is empty and no task is running.
		void waitIdle();

		size_t pending() const;
		size_t workerCount() const { return workers.size(); }

	private:
		std::string name;
		std::vector<std::thread> workers;
		std::queue<std::function<void()>> tasks;

		mutable std::mutex queueMutex;
		std::condition_variable cv;
		std::condition_variable idleCv;

		size_t running{ 0 };
		bool stop{ false };
		void workerLoop();
	};

}
