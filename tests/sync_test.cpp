#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "platform/Sync.h"

TEST(SyncTest, WaitForeverGuardAlwaysHoldsTheLock) {
  platform::Mutex mutex;
  {
    platform::LockGuard lock(mutex);
    EXPECT_TRUE(lock.locked());
  }
  // Released on scope exit, so a zero-timeout attempt succeeds.
  platform::LockGuard again(mutex, 0);
  EXPECT_TRUE(again.locked());
}

TEST(SyncTest, TimedGuardReportsContentionAndLeavesOwnerAlone) {
  platform::Mutex mutex;
  ASSERT_TRUE(mutex.lock());

  std::atomic<bool> gotLock{true};
  std::thread other([&] {
    platform::LockGuard lock(mutex, 20);
    gotLock = lock.locked();
  });
  other.join();
  EXPECT_FALSE(gotLock.load());

  // The failed guard must not have released the owner's lock.
  std::thread stillHeld([&] {
    platform::LockGuard lock(mutex, 0);
    gotLock = lock.locked();
  });
  stillHeld.join();
  EXPECT_FALSE(gotLock.load());

  mutex.unlock();
  platform::LockGuard after(mutex, 0);
  EXPECT_TRUE(after.locked());
}

TEST(SyncTest, WakeSignalLatchesOneNotification) {
  platform::WakeSignal wake;
  EXPECT_FALSE(wake.wait(0));
  wake.notify();
  wake.notify();
  EXPECT_TRUE(wake.wait(0));
  EXPECT_FALSE(wake.wait(0));
  wake.notify();
  wake.clear();
  EXPECT_FALSE(wake.wait(0));
}
