#include "TwoLockQueue.hpp"
#include <atomic>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{

constexpr std::size_t sMaxThread = 1024;

class UsageError: public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

std::size_t parseCount(const char* arg, std::size_t limit)
{
  std::string str(arg);
  // std::stoul accepts a leading sign and wraps negative values
  if(str.empty() || str.find_first_not_of("0123456789") != std::string::npos)
  {
    throw UsageError("not a positive integer: " + str);
  }
  unsigned long long value = 0;
  try
  {
    value = std::stoull(str);
  }
  catch(std::out_of_range&)
  {
    throw UsageError("out of range: " + str);
  }
  if(value == 0 || value > limit)
  {
    throw UsageError("must be between 1 and " + std::to_string(limit) + ": " + str);
  }
  return static_cast<std::size_t>(value);
}

void runStress(std::size_t numThread, std::size_t numOps)
{
  linked::TwoLockQueue<int> queue;
  std::atomic<std::size_t> pushCount = 0;
  std::atomic<std::size_t> popCount = 0;
  std::vector<std::thread> threads;
  threads.reserve(numThread);
  try
  {
    for(std::size_t i = 0; i < numThread; ++i)
    {
      threads.emplace_back([&queue, &pushCount, &popCount, numOps](){
        std::random_device rnd;
        std::mt19937 engine(rnd());
        std::bernoulli_distribution coin(0.5);
        for(std::size_t j = 0; j < numOps; ++j)
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
  catch(...)
  {
    // the threads already started still reference queue
    for(auto& t: threads)
    {
      t.join();
    }
    throw;
  }
  for(auto& t: threads)
  {
    t.join();
  }
  std::size_t drained = 0;
  while(queue.tryPop())
  {
    ++drained;
  }
  popCount.fetch_add(drained);

  std::cout << "threads: " << numThread << ", operations per thread: " << numOps << std::endl;
  std::cout << "pushes: " << pushCount.load() << std::endl;
  std::cout << "successful pops: " << popCount.load() << " (" << drained << " drained after join)" << std::endl;
  std::cout << "final size: " << queue.size() << std::endl;
  if(pushCount.load() != popCount.load() || queue.size() != 0 || queue.tryPop())
  {
    throw std::runtime_error("queue lost or duplicated elements");
  }
}

}

// usage: queue_stress [threads] [operations-per-thread]
int main(int argc, char** argv)
{
  try
  {
    std::size_t numThread = 8;
    std::size_t numOps = 1000;
    if(argc > 1)
    {
      numThread = parseCount(argv[1], sMaxThread);
    }
    if(argc > 2)
    {
      numOps = parseCount(argv[2], std::numeric_limits<std::size_t>::max());
    }
    runStress(numThread, numOps);
  }
  catch(UsageError& ex)
  {
    std::cerr << "invalid argument: " << ex.what() << std::endl;
    std::cerr << "usage: " << argv[0] << " [threads] [operations-per-thread]" << std::endl;
    return 1;
  }
  catch(std::exception& ex)
  {
    std::cerr << "queue_stress failed: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
