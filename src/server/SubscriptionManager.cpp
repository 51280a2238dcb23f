#include "SubscriptionManager.hpp"

#include <print>

using namespace WordleChain;

void SubscriptionManager::subscribe(PuzzleId puzzleId, crow::websocket::connection* conn) {
	std::lock_guard lock(mutex_);
	subscribers_[puzzleId].insert(conn);
}

bool SubscriptionManager::unsubscribe(PuzzleId puzzleId, crow::websocket::connection* conn) {
	std::lock_guard lock(mutex_);

	auto it = subscribers_.find(puzzleId);
	if (it == subscribers_.end()) return false;

	bool removed = it->second.erase(conn) > 0;
	if (it->second.empty()) subscribers_.erase(it);

	return removed;
}

void SubscriptionManager::unregisterConnection(crow::websocket::connection* conn) {
	std::lock_guard lock(mutex_);

	for (auto it = subscribers_.begin(); it != subscribers_.end();) {
		it->second.erase(conn);
		if (it->second.empty()) {
			it = subscribers_.erase(it);
		}
		else {
			++it;
		}
	}
}

void SubscriptionManager::broadcastToPuzzle(PuzzleId puzzleId, const std::string& message) {
	std::lock_guard lock(mutex_);

	auto it = subscribers_.find(puzzleId);
	if (it == subscribers_.end()) return;

	for (auto* conn : it->second) {
		sendTo(conn, message);
	}
}

void SubscriptionManager::sendTo(crow::websocket::connection* conn, const std::string& message) {
	if (conn) conn->send_text(message);
}

void SubscriptionManager::log(const std::string& message) {
	std::print("{}\n", message);
}
