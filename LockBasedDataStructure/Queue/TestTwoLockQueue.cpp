#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>
#include <thread>
#include <chrono>
#include <future>
#include <vector>
#include <random>
#include <atomic>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include "TwoLockQueue.hpp"

class jthread
{
private:
  std::thread t;
public:
  template <typename F, typename... Args>
  jthread(F&& f, Args&&... args): t(std::forward<F>(f), std::forward<Args>(args)...)
  {
    static_assert(std::is_invocable_v<F, Args&&...>);
  }
  jthread(const jthread&) = delete;
  jthread(jthread&&) = default;
  jthread& operator=(const jthread) = delete;
  jthread& operator=(jthread&&) = default;
  void join()
  {
    t.join();
  }
  ~jthread() noexcept
  {
    if(t.joinable())
    {
      t.join();
    }
  }
};

struct ThrowOnMove
{
  static inline bool sThrow = false;
  int mValue;
  explicit ThrowOnMove(int value): mValue(value) {}
  ThrowOnMove(ThrowOnMove&& other): mValue(other.mValue)
  {
    if(sThrow)
    {
      throw std::runtime_error("move failed");
    }
  }
};

BOOST_AUTO_TEST_CASE(TestTwoLockQueueEmpty)
{
  linked::TwoLockQueue<int> queue;
  BOOST_CHECK_EQUAL(queue.size(), 0u);
  BOOST_CHECK(queue.empty());
  BOOST_CHECK(!queue.tryPop());
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueSingleThread)
{
  linked::TwoLockQueue<int> queue;
  queue.push(1);
  queue.push(2);
  queue.push(3);
  BOOST_CHECK_EQUAL(queue.size(), 3u);
  BOOST_CHECK(!queue.empty());

  BOOST_CHECK_EQUAL(queue.tryPop().value(), 1);
  BOOST_CHECK_EQUAL(queue.tryPop().value(), 2);
  BOOST_CHECK_EQUAL(queue.tryPop().value(), 3);
  BOOST_CHECK(!queue.tryPop());
  BOOST_CHECK_EQUAL(queue.size(), 0u);

  // the promoted sentinel must accept new elements
  queue.push(4);
  BOOST_CHECK_EQUAL(queue.tryPop().value(), 4);
  BOOST_CHECK(!queue.tryPop());
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueSizeAtQuiescence)
{
  linked::TwoLockQueue<int> queue;
  for(int i = 0; i < 5; ++i)
  {
    queue.push(i);
  }
  BOOST_CHECK(queue.tryPop());
  BOOST_CHECK(queue.tryPop());
  BOOST_CHECK_EQUAL(queue.size(), 3u);
  queue.push(5);
  BOOST_CHECK_EQUAL(queue.size(), 4u);
  std::vector<int> rest;
  while(auto p = queue.tryPop())
  {
    rest.push_back(*p);
  }
  std::vector<int> expected{2, 3, 4, 5};
  BOOST_CHECK_EQUAL_COLLECTIONS(rest.begin(), rest.end(), expected.begin(), expected.end());
  BOOST_CHECK_EQUAL(queue.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueMoveOnly)
{
  linked::TwoLockQueue<std::unique_ptr<int>> queue;
  queue.push(std::make_unique<int>(42));
  queue.push(std::unique_ptr<int>());
  auto p = queue.tryPop();
  BOOST_REQUIRE(p && *p);
  BOOST_CHECK_EQUAL(**p, 42);
  p = queue.tryPop();
  BOOST_REQUIRE(p);
  BOOST_CHECK(!*p);
  BOOST_CHECK(!queue.tryPop());
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueThrowingMoveKeepsElement)
{
  linked::TwoLockQueue<ThrowOnMove> queue;
  queue.push(ThrowOnMove(7));
  queue.push(ThrowOnMove(8));
  ThrowOnMove::sThrow = true;
  BOOST_CHECK_THROW(queue.tryPop(), std::runtime_error);
  ThrowOnMove::sThrow = false;
  BOOST_CHECK_EQUAL(queue.size(), 2u);
  auto p = queue.tryPop();
  BOOST_REQUIRE(p);
  BOOST_CHECK_EQUAL(p->mValue, 7);
  // ThrowOnMove has no move assignment, so the second result gets its own variable
  auto q = queue.tryPop();
  BOOST_REQUIRE(q);
  BOOST_CHECK_EQUAL(q->mValue, 8);
  BOOST_CHECK(!queue.tryPop());
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueEmptyFollowsCounter)
{
  // tryPop decides emptiness from the counter alone, so at quiescence it
  // yields nothing exactly when size() reads zero
  linked::TwoLockQueue<int> queue;
  for(int round = 0; round < 3; ++round)
  {
    for(int i = 0; i <= round; ++i)
    {
      queue.push(i);
    }
    while(queue.size() != 0)
    {
      BOOST_CHECK(!queue.empty());
      BOOST_CHECK(queue.tryPop());
    }
    BOOST_CHECK(queue.empty());
    BOOST_CHECK(!queue.tryPop());
    BOOST_CHECK_EQUAL(queue.size(), 0u);
  }
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueDestructionReleasesElements)
{
  auto tracker = std::make_shared<int>(0);
  {
    linked::TwoLockQueue<std::shared_ptr<int>> queue;
    for(std::size_t i = 0; i < 200000; ++i)
    {
      queue.push(tracker);
    }
    BOOST_CHECK_EQUAL(tracker.use_count(), 200001);
    queue.tryPop();
    BOOST_CHECK_EQUAL(tracker.use_count(), 200000);
  }
  BOOST_CHECK_EQUAL(tracker.use_count(), 1);
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueSingleProducerSingleConsumer)
{
  static constexpr int numValue = 100000;
  linked::TwoLockQueue<int> queue;
  std::promise<void> start;
  auto fut = start.get_future().share();
  std::promise<std::vector<int>> promise;
  auto result = promise.get_future();
  {
    jthread push([&queue, start = fut](){
      start.wait();
      for(int i = 0; i < numValue; ++i)
      {
        queue.push(i);
      }
    });
    jthread pop([&queue, start = fut, promise = std::move(promise)]() mutable {
      start.wait();
      std::vector<int> ans;
      ans.reserve(numValue);
      while(ans.size() < static_cast<std::size_t>(numValue))
      {
        if(auto p = queue.tryPop())
        {
          ans.push_back(*p);
        }
      }
      promise.set_value(std::move(ans));
    });
    start.set_value();
  }
  auto data = result.get();
  std::vector<int> expected;
  for(int i = 0; i < numValue; ++i)
  {
    expected.push_back(i);
  }
  BOOST_CHECK_EQUAL_COLLECTIONS(data.begin(), data.end(), expected.begin(), expected.end());
  BOOST_CHECK_EQUAL(queue.size(), 0u);
  BOOST_CHECK(!queue.tryPop());
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueMultipleProducers)
{
  static constexpr int numThread = 10;
  static constexpr int numPush = 100;
  linked::TwoLockQueue<int> queue;
  {
    std::vector<jthread> threads;
    threads.reserve(numThread);
    for(int i = 0; i < numThread; ++i)
    {
      threads.emplace_back([&queue, i](){
        for(int j = 0; j < numPush; ++j)
        {
          queue.push(i * numPush + j);
        }
      });
    }
  }
  BOOST_CHECK_EQUAL(queue.size(), static_cast<std::size_t>(numThread * numPush));
  std::vector<int> data;
  while(auto p = queue.tryPop())
  {
    data.push_back(*p);
  }
  std::sort(data.begin(), data.end());
  std::vector<int> expected;
  for(int i = 0; i < numThread * numPush; ++i)
  {
    expected.push_back(i);
  }
  BOOST_CHECK_EQUAL_COLLECTIONS(data.begin(), data.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueMultipleConsumers)
{
  static constexpr int numThread = 5;
  static constexpr int numValue = 1000;
  linked::TwoLockQueue<int> queue;
  for(int i = 0; i < numValue; ++i)
  {
    queue.push(i);
  }
  std::atomic<std::size_t> counter = 0;
  std::vector<std::future<std::vector<int>>> results;
  for(int i = 0; i < numThread; ++i)
  {
    results.push_back(std::async(std::launch::async, [&queue, &counter](){
      std::vector<int> ans;
      while(auto p = queue.tryPop())
      {
        counter.fetch_add(1);
        ans.push_back(*p);
      }
      return ans;
    }));
  }
  std::vector<int> data;
  for(auto& fut: results)
  {
    auto vec = fut.get();
    // every consumer sees its share in FIFO order
    BOOST_CHECK(std::is_sorted(vec.begin(), vec.end()));
    data.insert(data.end(), vec.begin(), vec.end());
  }
  BOOST_CHECK_EQUAL(counter.load(), static_cast<std::size_t>(numValue));
  BOOST_CHECK_EQUAL(queue.size(), 0u);
  std::sort(data.begin(), data.end());
  std::vector<int> expected;
  for(int i = 0; i < numValue; ++i)
  {
    expected.push_back(i);
  }
  BOOST_CHECK_EQUAL_COLLECTIONS(data.begin(), data.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueProducersConsumers)
{
  static constexpr int numProducer = 4;
  static constexpr int numConsumer = 3;
  static constexpr int numPush = 1000;
  linked::TwoLockQueue<std::pair<int, int>> queue;
  std::atomic<int> producerDone = 0;
  std::promise<void> start;
  auto fut = start.get_future().share();
  std::vector<std::future<std::vector<std::pair<int, int>>>> results;
  {
    std::vector<jthread> producers;
    for(int n = 0; n < numProducer; ++n)
    {
      producers.emplace_back([&queue, &producerDone, n, start = fut](){
        std::random_device rnd;
        std::mt19937 engine(rnd());
        std::uniform_int_distribution<> dist(0, 10);
        start.wait();
        for(int i = 0; i < numPush; ++i)
        {
          if(i % 100 == 0)
          {
            std::this_thread::sleep_for(std::chrono::microseconds(dist(engine)));
          }
          queue.push(std::make_pair(n, i));
        }
        producerDone.fetch_add(1);
      });
    }
    for(int c = 0; c < numConsumer; ++c)
    {
      results.push_back(std::async(std::launch::async, [&queue, &producerDone, start = fut](){
        start.wait();
        std::vector<std::pair<int, int>> ans;
        while(true)
        {
          if(auto p = queue.tryPop())
          {
            ans.push_back(*p);
          }
          else if(producerDone.load() == numProducer)
          {
            // every push has bumped the counter by now, so an empty read here is final
            if(auto q = queue.tryPop())
            {
              ans.push_back(*q);
              continue;
            }
            break;
          }
        }
        return ans;
      }));
    }
    start.set_value();
  }
  std::vector<std::vector<int>> perProducer(numProducer);
  for(auto& res: results)
  {
    auto data = res.get();
    std::vector<std::vector<int>> seen(numProducer);
    for(auto& [n, i]: data)
    {
      seen[n].push_back(i);
      perProducer[n].push_back(i);
    }
    for(auto& vec: seen)
    {
      BOOST_CHECK(std::is_sorted(vec.begin(), vec.end()));
    }
  }
  std::vector<int> expected;
  for(int i = 0; i < numPush; ++i)
  {
    expected.push_back(i);
  }
  for(auto& vec: perProducer)
  {
    std::sort(vec.begin(), vec.end());
    BOOST_CHECK_EQUAL_COLLECTIONS(vec.begin(), vec.end(), expected.begin(), expected.end());
  }
  BOOST_CHECK_EQUAL(queue.size(), 0u);
  BOOST_CHECK(!queue.tryPop());
}

BOOST_AUTO_TEST_CASE(TestTwoLockQueueStress)
{
  static constexpr int numThread = 8;
  static constexpr int numOps = 10000;
  linked::TwoLockQueue<int> queue;
  std::atomic<std::size_t> pushCount = 0;
  std::atomic<std::size_t> popCount = 0;
  {
    std::vector<jthread> threads;
    for(int n = 0; n < numThread; ++n)
    {
      threads.emplace_back([&queue, &pushCount, &popCount](){
        std::random_device rnd;
        std::mt19937 engine(rnd());
        std::bernoulli_distribution coin(0.5);
        for(int i = 0; i < numOps; ++i)
        {
          if(coin(engine))
          {
            queue.push(1);
            pushCount.fetch_add(1);
          }
          else if(queue.tryPop())
          {
            popCount.fetch_add(1);
          }
        }
      });
    }
  }
  BOOST_CHECK_EQUAL(queue.size(), pushCount.load() - popCount.load());
  while(auto p = queue.tryPop())
  {
    BOOST_CHECK_EQUAL(*p, 1);
    popCount.fetch_add(1);
  }
  BOOST_CHECK_EQUAL(pushCount.load(), popCount.load());
  BOOST_CHECK_EQUAL(queue.size(), 0u);
  BOOST_CHECK(queue.empty());
  BOOST_CHECK(!queue.tryPop());
}
