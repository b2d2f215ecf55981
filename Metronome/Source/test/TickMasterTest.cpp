// Tests for TickMaster -- arbitration between the clock service and the
// fallback ticker, configuration pushes, and tick delivery.

#include <gtest/gtest.h>

#include <juce_core/juce_core.h>

#include <memory>
#include <thread>
#include <vector>

#include "../model/Tempo.h"
#include "../model/BeatLayout.h"
#include "../model/MetronomeConfig.h"
#include "../model/MetronomeState.h"
#include "../sync/TickConstants.h"
#include "../sync/TickMaster.h"
#include "../ui/BeatDispatcher.h"
#include "TestDoubles.h"

namespace {

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------

class TickMasterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (int i = 0; i < BeatDispatcher::MaxIndicators; i++) {
      lights[i].init(i + 1, &blinks);
      dispatcher.setIndicator(i + 1, &lights[i]);
    }
  }

  MetronomeState getState() {
    MetronomeState state;
    master.refreshState(&state);
    return state;
  }

  /// The fallback must be running exactly when playing without a clock service.
  void expectExclusive() {
    bool connected = (master.getConnectionState() == ConnectionConnected);
    EXPECT_EQ(master.isFallbackActive(), master.isPlaying() && !connected);
    if (connected) {
      EXPECT_EQ(master.getClockService(), &clock);
    } else {
      EXPECT_EQ(master.getClockService(), nullptr);
    }
  }

  std::vector<int> blinks;
  RecordingIndicator lights[BeatDispatcher::MaxIndicators];
  BeatDispatcher dispatcher;
  ManualControlSequence sequence;
  RecordingClockService clock;
  TickMaster master{&sequence, &dispatcher};
};

// ---------------------------------------------------------------------------
// Initial state
// ---------------------------------------------------------------------------

TEST_F(TickMasterTest, InitialState) {
  MetronomeState state = getState();
  EXPECT_EQ(state.tempo, Tempo::Default);
  EXPECT_FALSE(state.playing);
  EXPECT_EQ(state.connection, ConnectionDisconnected);
  EXPECT_EQ(state.source, TickSourceNone);
  EXPECT_EQ(state.fallbackBeat, 0);
  EXPECT_FALSE(master.isFallbackActive());
}

// ---------------------------------------------------------------------------
// Fallback while disconnected
// ---------------------------------------------------------------------------

TEST_F(TickMasterTest, StartWhileDisconnectedRunsFallback) {
  master.start();
  EXPECT_EQ(master.getLiveSource(), TickSourceFallback);
  EXPECT_TRUE(master.isFallbackActive());

  // default tempo 100 is 600ms per beat
  sequence.advance(0);
  sequence.advance(600);
  sequence.advance(600);
  std::vector<int> expected = {1, 2, 3};
  EXPECT_EQ(blinks, expected);
  EXPECT_EQ(getState().fallbackTicks, 3);
  EXPECT_EQ(getState().lastBeat, 3);
}

TEST_F(TickMasterTest, StopHaltsFallback) {
  master.start();
  sequence.advance(0);
  master.stop();
  EXPECT_FALSE(master.isFallbackActive());
  EXPECT_EQ(master.getLiveSource(), TickSourceNone);
  sequence.advance(10000);
  EXPECT_EQ(blinks.size(), 1u);
}

TEST_F(TickMasterTest, StartAndStopAreIdempotent) {
  master.start();
  master.start();
  EXPECT_EQ(sequence.getPendingCount(), 1);
  EXPECT_EQ(sequence.scheduleCount, 1);

  master.stop();
  master.stop();
  EXPECT_FALSE(master.isPlaying());
  EXPECT_EQ(sequence.getPendingCount(), 0);
}

TEST_F(TickMasterTest, FallbackFollowsTempoChanges) {
  master.start();
  sequence.advance(0);
  // the beat at 600 is already scheduled, the one after uses the new tempo
  master.setTempo(60);
  sequence.advance(600);
  EXPECT_EQ(blinks.size(), 2u);
  sequence.advance(999);
  EXPECT_EQ(blinks.size(), 2u);
  sequence.advance(1);
  EXPECT_EQ(blinks.size(), 3u);
}

TEST_F(TickMasterTest, FallbackFollowsLayoutChanges) {
  master.setTempo(120);
  master.start();
  sequence.advance(0);
  master.setLayout(master.getLayout().withBeats(2));
  sequence.advance(500 * 3);
  std::vector<int> expected = {1, 2, 1, 2};
  EXPECT_EQ(blinks, expected);
}

// ---------------------------------------------------------------------------
// Connect
// ---------------------------------------------------------------------------

TEST_F(TickMasterTest, ConnectPushesConfigurationInOrder) {
  juce::SortedSet<int> gaps;
  gaps.add(2);
  master.setTempo(120);
  master.setLayout(BeatLayout().withBeats(3).withGaps(gaps));
  master.start();

  master.connect(&clock);

  juce::StringArray expected;
  expected.add("beats 3");
  expected.add("subdivisions 1");
  expected.add("gaps 2");
  expected.add("tempo 120");
  expected.add("emphasize true");
  expected.add("sound true");
  expected.add("playing true");
  EXPECT_EQ(clock.calls, expected);
  EXPECT_EQ(master.getLiveSource(), TickSourceExternal);
}

TEST_F(TickMasterTest, ConnectWhileStoppedPushesStopped) {
  master.connect(&clock);
  ASSERT_GT(clock.calls.size(), 0);
  EXPECT_EQ(clock.calls[clock.calls.size() - 1], juce::String("playing false"));
  EXPECT_EQ(master.getLiveSource(), TickSourceNone);
}

TEST_F(TickMasterTest, ConnectStopsFallback) {
  master.start();
  sequence.advance(0);
  EXPECT_TRUE(master.isFallbackActive());

  master.connect(&clock);
  EXPECT_FALSE(master.isFallbackActive());
  EXPECT_EQ(sequence.getPendingCount(), 0);
  EXPECT_TRUE(master.isPlaying());
}

TEST_F(TickMasterTest, PendingFallbackBeatNeverFiresAfterConnect) {
  master.start();
  sequence.advance(0);
  sequence.advance(599);
  master.connect(&clock);
  sequence.advance(1);
  sequence.advance(5000);
  EXPECT_EQ(blinks.size(), 1u);
  EXPECT_EQ(getState().fallbackTicks, 1);
}

TEST_F(TickMasterTest, ConnectSameServiceIsIgnored) {
  master.connect(&clock);
  int count = clock.calls.size();
  master.connect(&clock);
  EXPECT_EQ(clock.calls.size(), count);
}

TEST_F(TickMasterTest, ConnectNullIsIgnored) {
  master.connect(nullptr);
  EXPECT_EQ(master.getConnectionState(), ConnectionDisconnected);
}

TEST_F(TickMasterTest, ReplacingServiceAdoptsState) {
  RecordingClockService other;
  master.connect(&clock);
  master.start();
  clock.calls.clear();

  master.connect(&other);
  EXPECT_EQ(master.getClockService(), &other);
  EXPECT_EQ(other.calls.size(), 7);
  EXPECT_TRUE(other.playing);

  // the outgoing service is stopped so only one clock is ticking
  juce::StringArray stopped;
  stopped.add("playing false");
  EXPECT_EQ(clock.calls, stopped);
  EXPECT_FALSE(clock.playing);
  clock.calls.clear();

  master.setTempo(90);
  EXPECT_EQ(clock.calls.size(), 0);
  EXPECT_EQ(other.tempo, 90);
}

TEST_F(TickMasterTest, ReplacingServiceWhileStoppedSendsNothingToOld) {
  RecordingClockService other;
  master.connect(&clock);
  clock.calls.clear();

  master.connect(&other);
  EXPECT_EQ(clock.calls.size(), 0);
  EXPECT_FALSE(other.playing);
}

// ---------------------------------------------------------------------------
// Disconnect
// ---------------------------------------------------------------------------

TEST_F(TickMasterTest, DisconnectWhilePlayingStartsFallbackAtBeatOne) {
  master.connect(&clock);
  master.start();
  master.externalTick(1);
  master.externalTick(2);
  master.externalTick(3);

  master.disconnect();
  EXPECT_EQ(master.getConnectionState(), ConnectionDisconnected);
  EXPECT_TRUE(master.isFallbackActive());
  EXPECT_EQ(master.getLiveSource(), TickSourceFallback);

  sequence.advance(0);
  std::vector<int> expected = {1, 2, 3, 1};
  EXPECT_EQ(blinks, expected);
}

TEST_F(TickMasterTest, DisconnectWhileStoppedStaysQuiet) {
  master.connect(&clock);
  master.disconnect();
  EXPECT_FALSE(master.isFallbackActive());
  sequence.advance(5000);
  EXPECT_TRUE(blinks.empty());
}

TEST_F(TickMasterTest, DisconnectWhenDisconnectedIsIgnored) {
  master.disconnect();
  EXPECT_EQ(master.getConnectionState(), ConnectionDisconnected);
  EXPECT_FALSE(master.isFallbackActive());
}

TEST_F(TickMasterTest, ReconnectAfterFallbackPushesCurrentState) {
  master.connect(&clock);
  master.start();
  master.disconnect();
  sequence.advance(0);

  // changes made while on the fallback reach the clock when it comes back
  master.setTempo(150);
  clock.calls.clear();
  master.connect(&clock);
  EXPECT_TRUE(clock.calls.contains("tempo 150"));
  EXPECT_EQ(clock.calls[clock.calls.size() - 1], juce::String("playing true"));
  EXPECT_FALSE(master.isFallbackActive());
}

// ---------------------------------------------------------------------------
// Forwarding while connected
// ---------------------------------------------------------------------------

TEST_F(TickMasterTest, StartStopForwardedWhenConnected) {
  master.connect(&clock);
  clock.calls.clear();

  master.start();
  master.start();
  master.stop();
  master.stop();

  juce::StringArray expected;
  expected.add("playing true");
  expected.add("playing false");
  EXPECT_EQ(clock.calls, expected);
  EXPECT_EQ(sequence.scheduleCount, 0);
}

TEST_F(TickMasterTest, TempoChangesForwardedOnlyWhenChanged) {
  master.connect(&clock);
  clock.calls.clear();

  EXPECT_TRUE(master.setTempo(130));
  EXPECT_FALSE(master.setTempo(130));
  EXPECT_TRUE(master.incrementTempo());
  EXPECT_TRUE(master.decrementTempoLarge());

  juce::StringArray expected;
  expected.add("tempo 130");
  expected.add("tempo 131");
  expected.add("tempo 121");
  EXPECT_EQ(clock.calls, expected);
}

TEST_F(TickMasterTest, TempoAtBoundNotForwarded) {
  master.setTempo(Tempo::Max);
  master.connect(&clock);
  clock.calls.clear();
  EXPECT_FALSE(master.incrementTempo());
  EXPECT_FALSE(master.incrementTempoLarge());
  EXPECT_EQ(clock.calls.size(), 0);
}

TEST_F(TickMasterTest, LayoutChangesForwardOnlyChangedFields) {
  master.connect(&clock);
  clock.calls.clear();

  master.setLayout(master.getLayout().withSound(false));
  master.setLayout(master.getLayout());
  master.setLayout(master.getLayout().withBeats(6).withEmphasizeFirstBeat(false));

  juce::StringArray expected;
  expected.add("sound false");
  expected.add("beats 6");
  expected.add("emphasize false");
  EXPECT_EQ(clock.calls, expected);
}

TEST_F(TickMasterTest, NothingForwardedWhenDisconnected) {
  master.setTempo(200);
  master.setLayout(master.getLayout().withBeats(5));
  master.start();
  master.stop();
  EXPECT_EQ(clock.calls.size(), 0);
  EXPECT_EQ(master.getTempo(), 200);
  EXPECT_EQ(master.getLayout().getBeats(), 5);
}

// ---------------------------------------------------------------------------
// Mutual exclusion
// ---------------------------------------------------------------------------

TEST_F(TickMasterTest, ExclusiveThroughFixedSequence) {
  expectExclusive();
  master.start();
  expectExclusive();
  master.connect(&clock);
  expectExclusive();
  master.disconnect();
  expectExclusive();
  master.stop();
  expectExclusive();
  master.connect(&clock);
  expectExclusive();
  master.start();
  expectExclusive();
  master.stop();
  expectExclusive();
  master.disconnect();
  expectExclusive();
  master.start();
  expectExclusive();
  master.start();
  expectExclusive();
}

TEST_F(TickMasterTest, ExclusiveThroughRandomInterleavings) {
  juce::Random random(20241018);

  for (int step = 0; step < 500; step++) {
    int op = random.nextInt(6);
    switch (op) {
      case 0: master.start(); break;
      case 1: master.stop(); break;
      case 2: master.connect(&clock); break;
      case 3: master.disconnect(); break;
      case 4: master.setTempo(random.nextInt(juce::Range<int>(1, 401))); break;
      case 5: {
        // time passes, only the fallback may produce ticks
        int before = getState().fallbackTicks;
        TickSource source = master.getLiveSource();
        sequence.advance(random.nextInt(2000));
        if (source != TickSourceFallback) {
          EXPECT_EQ(getState().fallbackTicks, before) << "step " << step;
        }
        break;
      }
    }
    expectExclusive();
    EXPECT_LE(sequence.getPendingCount(), 1) << "step " << step;
  }
}

// ---------------------------------------------------------------------------
// Ticks
// ---------------------------------------------------------------------------

TEST_F(TickMasterTest, ExternalTicksForwardedUnconditionally) {
  // a late tick after disconnect still reaches the lights
  master.externalTick(2);
  master.externalTick(12);
  std::vector<int> expected = {2};
  EXPECT_EQ(blinks, expected);
  EXPECT_EQ(getState().externalTicks, 2);
  EXPECT_EQ(getState().lastBeat, 12);
}

TEST_F(TickMasterTest, PostOnControlThreadIsImmediate) {
  master.postExternalTick(3);
  std::vector<int> expected = {3};
  EXPECT_EQ(blinks, expected);
  EXPECT_EQ(sequence.getPostedCount(), 0);
}

TEST_F(TickMasterTest, PostFromOtherThreadIsMarshaled) {
  master.connect(&clock);
  master.start();

  std::thread audio([this]() {
    master.postExternalTick(1);
    master.postExternalTick(2);
  });
  audio.join();

  EXPECT_TRUE(blinks.empty());
  EXPECT_EQ(sequence.getPostedCount(), 2);

  sequence.runPosted();
  std::vector<int> expected = {1, 2};
  EXPECT_EQ(blinks, expected);
  EXPECT_EQ(getState().externalTicks, 2);
}

TEST_F(TickMasterTest, PostedTickAfterDestructionDropped) {
  auto doomed = std::make_unique<TickMaster>(&sequence, &dispatcher);
  TickMaster* target = doomed.get();

  std::thread audio([target]() { target->postExternalTick(4); });
  audio.join();

  doomed.reset();
  EXPECT_EQ(sequence.runPosted(), 1);
  EXPECT_TRUE(blinks.empty());
}

// ---------------------------------------------------------------------------
// Configuration and lifecycle
// ---------------------------------------------------------------------------

TEST_F(TickMasterTest, LoadConfigThenReset) {
  MetronomeConfig config;
  config.maxTempo = 200;
  config.defaultTempo = 80;
  config.largeStep = 5;
  config.layout = BeatLayout().withBeats(3);

  master.loadConfig(&config);
  master.reset();
  EXPECT_EQ(master.getTempo(), 80);
  EXPECT_EQ(master.getLayout().getBeats(), 3);

  master.setTempo(300);
  EXPECT_EQ(master.getTempo(), 200);

  master.setTempo(100);
  master.incrementTempoLarge();
  EXPECT_EQ(master.getTempo(), 105);
}

TEST_F(TickMasterTest, LowerCeilingPushesTempo) {
  master.setTempo(300);
  master.connect(&clock);
  clock.calls.clear();

  MetronomeConfig config;
  config.maxTempo = 200;
  master.loadConfig(&config);

  juce::StringArray expected;
  expected.add("tempo 200");
  EXPECT_EQ(clock.calls, expected);
}

TEST_F(TickMasterTest, ResetWhileConnectedPushesFreshState) {
  master.connect(&clock);
  master.setTempo(180);
  master.start();
  clock.calls.clear();

  master.reset();
  EXPECT_FALSE(master.isPlaying());
  EXPECT_TRUE(clock.calls.contains("tempo 100"));
  EXPECT_EQ(clock.calls[clock.calls.size() - 1], juce::String("playing false"));
}

TEST_F(TickMasterTest, ShutdownStopsEverything) {
  master.start();
  sequence.advance(0);
  master.shutdown();
  EXPECT_FALSE(master.isPlaying());
  EXPECT_FALSE(master.isFallbackActive());
  EXPECT_EQ(sequence.getPendingCount(), 0);
  expectExclusive();

  master.connect(&clock);
  master.shutdown();
  EXPECT_EQ(master.getConnectionState(), ConnectionDisconnected);
  EXPECT_EQ(master.getClockService(), nullptr);
}

TEST_F(TickMasterTest, RefreshState) {
  master.setTempo(96);
  master.connect(&clock);
  master.start();
  master.externalTick(1);

  MetronomeState state = getState();
  EXPECT_EQ(state.tempo, 96);
  EXPECT_TRUE(state.playing);
  EXPECT_EQ(state.connection, ConnectionConnected);
  EXPECT_EQ(state.source, TickSourceExternal);
  EXPECT_EQ(state.fallbackBeat, 0);
  EXPECT_EQ(state.externalTicks, 1);
  EXPECT_EQ(state.lastBeat, 1);
}

}  // namespace
