#pragma once
#include <mutex>
#include <memory>
#include <atomic>
#include <optional>
#include <cstddef>
#include <utility>

namespace linked
{

// Unbounded FIFO queue with one lock for each end.
// The first node is always an empty sentinel, so push only touches the tail
// and tryPop only touches the head, and the two never block each other.
//
// The locks are plain std::mutex taken through RAII guards. An exception
// thrown while one of them is held unlocks it and leaves the chain intact,
// so there is no poisoned state.
template <typename T>
class TwoLockQueue
{
private:
  struct Node
  {
    std::optional<T> mData;
    std::unique_ptr<Node> mNext;
  };
  std::mutex mHeadLock;
  std::unique_ptr<Node> mHead;
  std::mutex mTailLock;
  // Non-owning. Only read or written under mTailLock. It always designates the
  // last node, and tryPop never frees a node past mHead, so at worst it points
  // at the node being promoted to sentinel, which stays alive as the new head.
  Node* mTail;
  // Number of real nodes. May lag behind the chain while a push or pop is in
  // flight.
  std::atomic<std::size_t> mSize;
private:
  template <typename U>
  void pushImpl(U&& val);
public:
  TwoLockQueue();
  ~TwoLockQueue();
  TwoLockQueue(const TwoLockQueue&) = delete;
  TwoLockQueue(TwoLockQueue&&) = delete;
  TwoLockQueue& operator=(const TwoLockQueue&) = delete;
  TwoLockQueue& operator=(TwoLockQueue&&) = delete;
  void push(const T& val);
  void push(T&& val);
  // Returns std::nullopt when the counter reads zero. A push that has linked
  // its node but not yet bumped the counter is not seen.
  std::optional<T> tryPop();
  std::size_t size() const;
  bool empty() const;
};

template <typename T>
TwoLockQueue<T>::TwoLockQueue(): mHead(std::make_unique<Node>()), mTail(mHead.get()), mSize(0) {}

template <typename T>
TwoLockQueue<T>::~TwoLockQueue()
{
  // unlink one node at a time, recursive unique_ptr destruction would grow the stack with the queue
  auto node = std::move(mHead);
  while(node)
  {
    node = std::move(node->mNext);
  }
}

template <typename T>
template <typename U>
void TwoLockQueue<T>::pushImpl(U&& val)
{
  auto newNode = std::make_unique<Node>();
  newNode->mData.emplace(std::forward<U>(val));
  Node* newTail = newNode.get();
  {
    std::lock_guard lk(mTailLock);
    mTail->mNext = std::move(newNode);
    mTail = newTail;
  }
  mSize.fetch_add(1, std::memory_order_seq_cst);
}
template <typename T>
void TwoLockQueue<T>::push(const T& val)
{
  pushImpl(val);
}
template <typename T>
void TwoLockQueue<T>::push(T&& val)
{
  pushImpl(std::move(val));
}
template <typename T>
std::optional<T> TwoLockQueue<T>::tryPop()
{
  std::lock_guard lk(mHeadLock);
  if(mSize.load(std::memory_order_acquire) == 0)
  {
    return std::nullopt;
  }
  // move the value out before unlinking anything.
  // if T's move constructor throws, the element is still in the queue.
  std::optional<T> ans(std::move(mHead->mNext->mData));
  auto oldHead = std::move(mHead);
  mHead = std::move(oldHead->mNext);
  mHead->mData.reset();
  mSize.fetch_sub(1, std::memory_order_seq_cst);
  return ans;
}
template <typename T>
std::size_t TwoLockQueue<T>::size() const
{
  return mSize.load(std::memory_order_acquire);
}
template <typename T>
bool TwoLockQueue<T>::empty() const
{
  return size() == 0;
}

}
