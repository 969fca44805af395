#pragma once
#include <memory>
#include <optional>
#include <ostream>
#include <cstddef>
#include <utility>

namespace linked
{

// Not thread safe.
// Every node is owned by its predecessor through mNext, the head by the list.
// mPrev and mTail are plain pointers into that chain.
template <typename T>
class DoublyLinkedList
{
private:
  struct Node
  {
    T mValue;
    std::unique_ptr<Node> mNext;
    // Non-owning. Null for the head; otherwise the node whose mNext owns this one.
    Node* mPrev;
    template <typename U>
    explicit Node(U&& val): mValue(std::forward<U>(val)), mNext(nullptr), mPrev(nullptr) {}
  };
  std::unique_ptr<Node> mHead;
  // Non-owning. Null iff mHead is null, otherwise the last node of the chain.
  Node* mTail;
  std::size_t mSize;
private:
  template <typename U>
  void pushBackImpl(U&& val);
  template <typename U>
  void pushFrontImpl(U&& val);
  void clear();
public:
  DoublyLinkedList();
  ~DoublyLinkedList();
  DoublyLinkedList(const DoublyLinkedList&) = delete;
  DoublyLinkedList& operator=(const DoublyLinkedList&) = delete;
  DoublyLinkedList(DoublyLinkedList&& other) noexcept;
  DoublyLinkedList& operator=(DoublyLinkedList&& other) noexcept;
  std::size_t size() const;
  bool empty() const;
  void pushBack(const T& val);
  void pushBack(T&& val);
  void pushFront(const T& val);
  void pushFront(T&& val);
  std::optional<T> popBack();
  std::optional<T> popFront();

  template <typename U>
  friend bool operator==(const DoublyLinkedList<U>& lhs, const DoublyLinkedList<U>& rhs);
  template <typename U>
  friend std::ostream& operator<<(std::ostream& os, const DoublyLinkedList<U>& list);
};

template <typename T>
DoublyLinkedList<T>::DoublyLinkedList(): mHead(nullptr), mTail(nullptr), mSize(0) {}
template <typename T>
DoublyLinkedList<T>::~DoublyLinkedList()
{
  clear();
}
template <typename T>
DoublyLinkedList<T>::DoublyLinkedList(DoublyLinkedList&& other) noexcept
  : mHead(std::move(other.mHead))
  , mTail(std::exchange(other.mTail, nullptr))
  , mSize(std::exchange(other.mSize, 0)) {}
template <typename T>
DoublyLinkedList<T>& DoublyLinkedList<T>::operator=(DoublyLinkedList&& other) noexcept
{
  if(this != &other)
  {
    clear();
    mHead = std::move(other.mHead);
    mTail = std::exchange(other.mTail, nullptr);
    mSize = std::exchange(other.mSize, 0);
  }
  return *this;
}
template <typename T>
void DoublyLinkedList<T>::clear()
{
  auto node = std::move(mHead);
  while(node)
  {
    node = std::move(node->mNext);
  }
  mTail = nullptr;
  mSize = 0;
}
template <typename T>
std::size_t DoublyLinkedList<T>::size() const
{
  return mSize;
}
template <typename T>
bool DoublyLinkedList<T>::empty() const
{
  return mSize == 0;
}
template <typename T>
template <typename U>
void DoublyLinkedList<T>::pushBackImpl(U&& val)
{
  auto newNode = std::make_unique<Node>(std::forward<U>(val));
  newNode->mPrev = mTail;
  Node* newTail = newNode.get();
  if(mTail)
  {
    mTail->mNext = std::move(newNode);
  }
  else
  {
    mHead = std::move(newNode);
  }
  mTail = newTail;
  ++mSize;
}
template <typename T>
template <typename U>
void DoublyLinkedList<T>::pushFrontImpl(U&& val)
{
  auto newNode = std::make_unique<Node>(std::forward<U>(val));
  if(mHead)
  {
    mHead->mPrev = newNode.get();
    newNode->mNext = std::move(mHead);
  }
  else
  {
    mTail = newNode.get();
  }
  mHead = std::move(newNode);
  ++mSize;
}
template <typename T>
void DoublyLinkedList<T>::pushBack(const T& val)
{
  pushBackImpl(val);
}
template <typename T>
void DoublyLinkedList<T>::pushBack(T&& val)
{
  pushBackImpl(std::move(val));
}
template <typename T>
void DoublyLinkedList<T>::pushFront(const T& val)
{
  pushFrontImpl(val);
}
template <typename T>
void DoublyLinkedList<T>::pushFront(T&& val)
{
  pushFrontImpl(std::move(val));
}
template <typename T>
std::optional<T> DoublyLinkedList<T>::popBack()
{
  if(!mTail)
  {
    return std::nullopt;
  }
  std::optional<T> ans(std::move(mTail->mValue));
  Node* prev = mTail->mPrev;
  if(prev)
  {
    prev->mNext.reset();
  }
  else
  {
    mHead.reset();
  }
  mTail = prev;
  --mSize;
  return ans;
}
template <typename T>
std::optional<T> DoublyLinkedList<T>::popFront()
{
  if(!mHead)
  {
    return std::nullopt;
  }
  std::optional<T> ans(std::move(mHead->mValue));
  auto oldHead = std::move(mHead);
  mHead = std::move(oldHead->mNext);
  if(mHead)
  {
    mHead->mPrev = nullptr;
  }
  else
  {
    mTail = nullptr;
  }
  --mSize;
  return ans;
}

template <typename U>
bool operator==(const DoublyLinkedList<U>& lhs, const DoublyLinkedList<U>& rhs)
{
  if(lhs.mSize != rhs.mSize)
  {
    return false;
  }
  auto l = lhs.mHead.get();
  auto r = rhs.mHead.get();
  while(l && r)
  {
    if(!(l->mValue == r->mValue))
    {
      return false;
    }
    l = l->mNext.get();
    r = r->mNext.get();
  }
  return true;
}
template <typename U>
bool operator!=(const DoublyLinkedList<U>& lhs, const DoublyLinkedList<U>& rhs)
{
  return !(lhs == rhs);
}
template <typename U>
std::ostream& operator<<(std::ostream& os, const DoublyLinkedList<U>& list)
{
  os << "LinkList [";
  for(auto node = list.mHead.get(); node; node = node->mNext.get())
  {
    os << node->mValue;
    if(node->mNext)
    {
      os << ", ";
    }
  }
  return os << "]";
}

}
