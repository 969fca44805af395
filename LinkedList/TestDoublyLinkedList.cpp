#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>
#include <sstream>
#include <string>
#include <memory>
#include "DoublyLinkedList.hpp"

template <typename T>
std::string toString(const linked::DoublyLinkedList<T>& list)
{
  std::ostringstream os;
  os << list;
  return os.str();
}

BOOST_AUTO_TEST_CASE(TestDoublyLinkedListNew)
{
  linked::DoublyLinkedList<int> list;
  BOOST_CHECK_EQUAL(list.size(), 0u);
  BOOST_CHECK(list.empty());
  BOOST_CHECK_EQUAL(toString(list), "LinkList []");
}

BOOST_AUTO_TEST_CASE(TestDoublyLinkedListPush)
{
  linked::DoublyLinkedList<int> list;
  list.pushBack(1);
  BOOST_CHECK_EQUAL(toString(list), "LinkList [1]");
  list.pushFront(2);
  BOOST_CHECK_EQUAL(toString(list), "LinkList [2, 1]");
  list.pushBack(3);
  list.pushFront(4);
  BOOST_CHECK_EQUAL(toString(list), "LinkList [4, 2, 1, 3]");
  BOOST_CHECK_EQUAL(list.size(), 4u);
}

BOOST_AUTO_TEST_CASE(TestDoublyLinkedListPop)
{
  linked::DoublyLinkedList<int> list;
  BOOST_CHECK(!list.popFront());
  BOOST_CHECK(!list.popBack());

  list.pushBack(1);
  list.pushBack(2);
  list.pushBack(3);
  BOOST_CHECK_EQUAL(list.popBack().value(), 3);
  BOOST_CHECK_EQUAL(list.popBack().value(), 2);
  BOOST_CHECK_EQUAL(list.popBack().value(), 1);
  BOOST_CHECK(!list.popBack());
  BOOST_CHECK_EQUAL(list.size(), 0u);

  list.pushBack(1);
  list.pushBack(2);
  list.pushBack(3);
  BOOST_CHECK_EQUAL(list.popFront().value(), 1);
  BOOST_CHECK_EQUAL(list.popFront().value(), 2);
  BOOST_CHECK_EQUAL(list.popFront().value(), 3);
  BOOST_CHECK(!list.popFront());
  BOOST_CHECK_EQUAL(list.size(), 0u);
  BOOST_CHECK_EQUAL(toString(list), "LinkList []");
}

BOOST_AUTO_TEST_CASE(TestDoublyLinkedListMixed)
{
  linked::DoublyLinkedList<int> list;
  list.pushFront(1);
  list.pushBack(2);
  list.pushFront(3);
  BOOST_CHECK_EQUAL(list.popBack().value(), 2);
  list.pushBack(4);
  BOOST_CHECK_EQUAL(list.popFront().value(), 3);
  BOOST_CHECK_EQUAL(toString(list), "LinkList [1, 4]");
  BOOST_CHECK_EQUAL(list.size(), 2u);

  // drain from both ends down to a single node and refill it
  BOOST_CHECK_EQUAL(list.popFront().value(), 1);
  BOOST_CHECK_EQUAL(list.popBack().value(), 4);
  list.pushFront(5);
  BOOST_CHECK_EQUAL(list.popBack().value(), 5);
  list.pushBack(6);
  BOOST_CHECK_EQUAL(list.popFront().value(), 6);
  BOOST_CHECK(list.empty());
}

BOOST_AUTO_TEST_CASE(TestDoublyLinkedListMoveOnly)
{
  linked::DoublyLinkedList<std::unique_ptr<int>> list;
  list.pushBack(std::make_unique<int>(1));
  list.pushFront(std::make_unique<int>(0));
  auto front = list.popFront();
  BOOST_REQUIRE(front && *front);
  BOOST_CHECK_EQUAL(**front, 0);
  auto back = list.popBack();
  BOOST_REQUIRE(back && *back);
  BOOST_CHECK_EQUAL(**back, 1);
}

BOOST_AUTO_TEST_CASE(TestDoublyLinkedListMove)
{
  linked::DoublyLinkedList<std::string> list;
  list.pushBack("a");
  list.pushBack("b");
  auto other = std::move(list);
  BOOST_CHECK_EQUAL(toString(other), "LinkList [a, b]");
  BOOST_CHECK_EQUAL(other.size(), 2u);
  BOOST_CHECK_EQUAL(list.size(), 0u);
  BOOST_CHECK(!list.popBack());

  list.pushBack("c");
  BOOST_CHECK_EQUAL(toString(list), "LinkList [c]");
  list = std::move(other);
  BOOST_CHECK_EQUAL(toString(list), "LinkList [a, b]");
  BOOST_CHECK(other.empty());
  BOOST_CHECK_EQUAL(list.popBack().value(), "b");
  BOOST_CHECK_EQUAL(list.popBack().value(), "a");
}

BOOST_AUTO_TEST_CASE(TestDoublyLinkedListEquality)
{
  linked::DoublyLinkedList<int> lhs;
  linked::DoublyLinkedList<int> rhs;
  BOOST_CHECK(lhs == rhs);
  lhs.pushBack(1);
  lhs.pushBack(2);
  rhs.pushFront(2);
  rhs.pushFront(1);
  BOOST_CHECK(lhs == rhs);
  rhs.pushBack(3);
  BOOST_CHECK(lhs != rhs);
  lhs.pushBack(4);
  BOOST_CHECK(lhs != rhs);
}

BOOST_AUTO_TEST_CASE(TestDoublyLinkedListLongChain)
{
  auto tracker = std::make_shared<int>(0);
  {
    linked::DoublyLinkedList<std::shared_ptr<int>> list;
    for(std::size_t i = 0; i < 200000; ++i)
    {
      list.pushBack(tracker);
    }
    BOOST_CHECK_EQUAL(list.size(), 200000u);
    BOOST_CHECK_EQUAL(tracker.use_count(), 200001);
  }
  BOOST_CHECK_EQUAL(tracker.use_count(), 1);
}
