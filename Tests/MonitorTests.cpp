/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <memory>
#include <stdexcept>
#include <vector>
#include <gtest/gtest.h>

#include "Monitor.hpp"
#include "Alert/AlertDispatcher.hpp"
#include "TestFakes.hpp"

namespace
{
	class MonitorTest : public ::testing::Test
	{
	protected:
		std::shared_ptr<LScriptedSampler> Sampler = std::make_shared<LScriptedSampler>();
		std::shared_ptr<LFakeProcessInfo> ProcessInfo = std::make_shared<LFakeProcessInfo>();
		std::vector<LAlertEvent>          Alerts{};

		std::unique_ptr<LMonitor> Monitor{};

		void Build(std::string const& Targets, std::string const& Excludes)
		{
			Monitor = std::make_unique<LMonitor>(
				LRangeMatcher(LRangeSet::Parse(Targets, "target"), LRangeSet::Parse(Excludes, "exclude")),
				Sampler, ProcessInfo, std::chrono::milliseconds(0));
			Monitor->OnAlert.connect([this](LAlertEvent const& Event) { Alerts.push_back(Event); });
		}
	};

	// Throws something that isn't a sampling error
	class LBrokenSampler final : public IConnectionSampler
	{
	public:
		std::vector<LConnectionSample> Sample() override { throw std::logic_error("corrupted state"); }
	};
} // namespace

TEST_F(MonitorTest, ExcludedNeverAlertsTargetedAlertsOncePerEpisode)
{
	Build("10.0.0.0/8", "10.0.0.1/32");

	for (int Cycle = 0; Cycle < 3; ++Cycle)
	{
		Sampler->AddCycle({ MakeSample("10.0.0.1", 443), MakeSample("10.0.0.2", 443) });
	}

	EXPECT_EQ(Monitor->RunCycle(), 1u);
	EXPECT_EQ(Monitor->RunCycle(), 0u);
	EXPECT_EQ(Monitor->RunCycle(), 0u);

	ASSERT_EQ(Alerts.size(), 1u);
	EXPECT_EQ(Alerts[0].Remote, MakeKey("10.0.0.2", 443));
	EXPECT_FALSE(Monitor->GetTracker().IsAlerted(MakeKey("10.0.0.1", 443)));
}

TEST_F(MonitorTest, RealertsAfterEndpointDisappears)
{
	Build("192.168.0.0/16", "");

	Sampler->AddCycle({ MakeSample("192.168.1.5", 22) });
	Sampler->AddCycle({});
	Sampler->AddCycle({ MakeSample("192.168.1.5", 22) });

	EXPECT_EQ(Monitor->RunCycle(), 1u);
	EXPECT_EQ(Monitor->GetTracker().GetAlertMemory(), std::unordered_set<LEndpointKey>{ MakeKey("192.168.1.5", 22) });

	EXPECT_EQ(Monitor->RunCycle(), 0u);
	EXPECT_EQ(Monitor->GetTracker().Size(), 0u);

	EXPECT_EQ(Monitor->RunCycle(), 1u);
	EXPECT_EQ(Alerts.size(), 2u);
}

TEST_F(MonitorTest, ReconcilesAgainstAllEstablishedConnections)
{
	Build("10.0.0.0/8", "10.0.0.7/32");

	// The endpoint keeps existing but is excluded in between, it must still count as present
	Sampler->AddCycle({ MakeSample("10.0.0.9", 80) });
	Sampler->AddCycle({ MakeSample("10.0.0.9", 80), MakeSample("8.8.8.8", 53) });
	Sampler->AddCycle({ MakeSample("10.0.0.9", 80) });

	Monitor->RunCycle();
	Monitor->RunCycle();
	Monitor->RunCycle();
	EXPECT_EQ(Alerts.size(), 1u);
}

TEST_F(MonitorTest, SkipsNonEstablishedAndUnspecifiedRemotes)
{
	Build("0.0.0.0/0", "");

	Sampler->AddCycle({
		MakeSample("10.0.0.1", 443, 50000, std::nullopt, ETcpState::TimeWait),
		MakeSample("0.0.0.0", 0),
		MakeSample("10.0.0.2", 0),
	});

	EXPECT_EQ(Monitor->RunCycle(), 0u);
	EXPECT_TRUE(Alerts.empty());
}

TEST_F(MonitorTest, ResolvesProcessNameOnlyForFiredAlerts)
{
	Build("10.0.0.0/8", "");
	ProcessInfo->Names[77] = "ssh";

	Sampler->AddCycle({ MakeSample("10.0.0.2", 22, 40000, 77), MakeSample("10.0.0.3", 22) });
	Sampler->AddCycle({ MakeSample("10.0.0.2", 22, 40000, 77), MakeSample("10.0.0.3", 22) });

	Monitor->RunCycle();
	Monitor->RunCycle();

	ASSERT_EQ(Alerts.size(), 2u);
	EXPECT_EQ(Alerts[0].ProcessName, "ssh");
	EXPECT_EQ(Alerts[1].ProcessName, IProcessInfo::UnknownName);
	EXPECT_EQ(ProcessInfo->Lookups, std::vector<LProcessId>{ 77 });
}

TEST_F(MonitorTest, PreCancelledRunDoesNotSample)
{
	Build("10.0.0.0/8", "");

	LCancellation Stop;
	Stop.RequestStop();
	EXPECT_EQ(Monitor->Run(Stop), EMonitorExit::Stopped);
	EXPECT_EQ(Sampler->CallCount, 0u);
}

TEST_F(MonitorTest, RunStopsWhenCancelledDuringCycle)
{
	Build("10.0.0.0/8", "");

	LCancellation Stop;
	Sampler->OnSample = [&] {
		if (Sampler->CallCount == 3)
		{
			Stop.RequestStop();
		}
	};

	EXPECT_EQ(Monitor->Run(Stop), EMonitorExit::Stopped);
	EXPECT_EQ(Sampler->CallCount, 3u);
	EXPECT_EQ(Monitor->GetCycleCount(), 3u);
}

TEST_F(MonitorTest, SamplingErrorKeepsStateAndLoopGoing)
{
	Build("10.0.0.0/8", "");

	LCancellation Stop;
	Sampler->AddCycle({ MakeSample("10.0.0.2", 443) });
	Sampler->AddFailure();
	Sampler->AddCycle({ MakeSample("10.0.0.2", 443) });
	Sampler->OnSample = [&] {
		if (Sampler->CallCount == 3)
		{
			Stop.RequestStop();
		}
	};

	EXPECT_EQ(Monitor->Run(Stop), EMonitorExit::Stopped);
	EXPECT_EQ(Monitor->GetFailedSampleCount(), 1u);
	// The failed cycle didn't reconcile, so the endpoint is still remembered and doesn't alert again
	EXPECT_EQ(Alerts.size(), 1u);
	EXPECT_TRUE(Monitor->GetTracker().IsAlerted(MakeKey("10.0.0.2", 443)));
}

TEST_F(MonitorTest, DispatchFailureStillMarksEndpointAlerted)
{
	Build("10.0.0.0/8", "");
	auto Sink = std::make_shared<LRecordingSink>();
	Sink->bSucceed = false;
	LAlertDispatcher Dispatcher(Sink, "Lauscher Alert");
	Dispatcher.Attach(Monitor->OnAlert);

	Sampler->AddCycle({ MakeSample("10.0.0.2", 443) });
	Sampler->AddCycle({ MakeSample("10.0.0.2", 443) });

	Monitor->RunCycle();
	Monitor->RunCycle();

	EXPECT_EQ(Sink->Notifications.size(), 1u);
	EXPECT_EQ(Dispatcher.GetFailedCount(), 1u);
	EXPECT_TRUE(Monitor->GetTracker().IsAlerted(MakeKey("10.0.0.2", 443)));
}

TEST(Monitor, UnexpectedFailureStopsLoop)
{
	LMonitor Monitor(LRangeMatcher(LRangeSet::Parse("10.0.0.0/8", "target"), LRangeSet{}),
		std::make_shared<LBrokenSampler>(), std::make_shared<LFakeProcessInfo>(), std::chrono::milliseconds(0));

	LCancellation Stop;
	EXPECT_EQ(Monitor.Run(Stop), EMonitorExit::Failure);
	EXPECT_FALSE(Stop.IsStopRequested());
}
