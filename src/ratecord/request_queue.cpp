// Ratecord - rate limit aware Discord REST client for C++11 using boost libraries.
// Copyright © 2017 Maks Mazurov (fox.cpp) <foxcpp@yandex.ru>
// 
// Permission is hereby granted, free of charge, to any person obtaining
// a copy of this software and associated documentation files (the "Software"),
// to deal in the Software without restriction, including without limitation
// the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the
// Software is furnished to do so, subject to the following conditions:
// 
// The above copyright notice and this permission notice shall be included
// in all copies or substantial portions of the Software.
// 
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
// EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
// OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
// IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
// DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
// TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
// OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.


#include <ratecord/request_queue.hpp>

#include <algorithm>
#include <iterator>

namespace Ratecord {

namespace {
    bool sequenceLess(const PendingRequestPtr& lhs, const PendingRequestPtr& rhs) {
        return lhs->sequence < rhs->sequence;
    }
}

const char* toString(RequestState state) {
    switch (state) {
    case RequestState::Queued:             return "Queued";
    case RequestState::WaitingForCapacity: return "WaitingForCapacity";
    case RequestState::InFlight:           return "InFlight";
    case RequestState::Retrying:           return "Retrying";
    case RequestState::Succeeded:          return "Succeeded";
    case RequestState::Failed:             return "Failed";
    }
    return "Unknown";
}

void RequestQueue::enqueue(const std::string& bucketKey, PendingRequestPtr request) {
    request->state = RequestState::Queued;
    queues[bucketKey].push_back(std::move(request));
}

void RequestQueue::requeueFront(const std::string& bucketKey, PendingRequestPtr request) {
    auto& queue = queues[bucketKey];
    auto position = std::upper_bound(queue.begin(), queue.end(), request, sequenceLess);
    queue.insert(position, std::move(request));
}

PendingRequestPtr RequestQueue::front(const std::string& bucketKey) const {
    auto it = queues.find(bucketKey);
    return it != queues.end() ? it->second.front() : nullptr;
}

PendingRequestPtr RequestQueue::dequeueNextReady(const std::string& bucketKey, BucketStore& store, TimePoint now) {
    auto it = queues.find(bucketKey);
    if (it == queues.end()) return nullptr;

    PendingRequestPtr head = it->second.front();
    if (head->notBefore > now || !store.isAvailable(bucketKey, now)) return nullptr;

    it->second.pop_front();
    if (it->second.empty()) queues.erase(it);
    return head;
}

bool RequestQueue::remove(const std::string& bucketKey, const PendingRequestPtr& request) {
    auto it = queues.find(bucketKey);
    if (it == queues.end()) return false;

    auto position = std::find(it->second.begin(), it->second.end(), request);
    if (position == it->second.end()) return false;

    it->second.erase(position);
    if (it->second.empty()) queues.erase(it);
    return true;
}

void RequestQueue::reconcile(const std::string& from, const std::string& to) {
    if (from == to) return;

    auto fromIt = queues.find(from);
    if (fromIt == queues.end()) return;

    std::deque<PendingRequestPtr> moved = std::move(fromIt->second);
    queues.erase(fromIt);

    auto& target = queues[to];
    std::deque<PendingRequestPtr> merged;
    std::merge(target.begin(), target.end(), moved.begin(), moved.end(), std::back_inserter(merged), sequenceLess);
    target = std::move(merged);
}

bool RequestQueue::contains(const std::string& bucketKey) const {
    return queues.find(bucketKey) != queues.end();
}

std::size_t RequestQueue::size(const std::string& bucketKey) const {
    auto it = queues.find(bucketKey);
    return it != queues.end() ? it->second.size() : 0;
}

std::size_t RequestQueue::size() const {
    std::size_t result = 0;
    for (const auto& queue : queues) {
        result += queue.second.size();
    }
    return result;
}

} // namespace Ratecord
