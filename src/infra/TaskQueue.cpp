#include "TaskQueue.hpp"
#include <print>

namespace WordleChain {

	TaskQueue::TaskQueue(size_t numWorkers, std::string name)
		: name(std::move(name)) {

		size_t threadsToCreate = numWorkers > 0 ? numWorkers : 1;

		for (size_t i = 0; i < threadsToCreate; ++i) {
			workers.emplace_back(&TaskQueue::workerLoop, this);
		}
	}

	TaskQueue::~TaskQueue() {
		{
			std::unique_lock<std::mutex> lock(queueMutex);
			stop = true;
		}
		cv.notify_all();
		for (auto& worker : workers) {
			if (worker.joinable()) {
				worker.join();
			}
		}
	}

	void TaskQueue::enqueue(std::function<void()> task) {
		{
			std::unique_lock<std::mutex> lock(queueMutex);
			if (stop) {
				std::print("[{}] Task dropped, queue is shutting down\n", name);
				return;
			}
			tasks.push(std::move(task));
		}
		cv.notify_one();
	}

	void TaskQueue::waitIdle() {
		std::unique_lock<std::mutex> lock(queueMutex);
		idleCv.wait(lock, [this]() { return tasks.empty() && running == 0; });
	}

	size_t TaskQueue::pending() const {
		std::unique_lock<std::mutex> lock(queueMutex);
		return tasks.size();
	}

	void TaskQueue::workerLoop() {
		while (true) {
			std::function<void()> task;
			{
				std::unique_lock<std::mutex> lock(queueMutex);
				cv.wait(lock, [this]() { return stop || !tasks.empty(); });
				if (stop && tasks.empty()) {
					return;
				}
				task = std::move(tasks.front());
				tasks.pop();
				++running;
			}
			try {
				task();
			}
			catch (const std::exception& e) {
				std::print("[{}] Exception in task: {}\n", name, e.what());
			}
			catch (...) {
				std::print("[{}] Unknown exception in task\n", name);
			}
			{
				std::unique_lock<std::mutex> lock(queueMutex);
				--running;
				if (tasks.empty() && running == 0) {
					idleCv.notify_all();
				}
			}
		}
	}
}
