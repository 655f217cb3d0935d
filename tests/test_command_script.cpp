#include "clinic.hpp"
#include "cli/command_script.hpp"
#include "cli/workload.hpp"
#include "model/config.hpp"
#include "report/report.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <string>

TEST(CommandScript, RunsAFullSession) {
    Clinic clinic(10);
    std::istringstream script(
        "# setup\n"
        "doctor 1 Rao General\n"
        "slot 1 101 09:00 09:15\n"
        "slot 1 102 09:15 09:30\n"
        "patient 1 Alice 30\n"
        "patient 2 Bob 45\n"
        "\n"
        "book 1 1\n"
        "book 2 1\n"
        "triage 3 0 1\n"
        "serve\n"
        "serve\n"
        "undo\n"
        "top 2\n");
    std::ostringstream out;
    std::ostringstream err;
    ScriptResult result = runScript(clinic, script, out, err);
    EXPECT_EQ(result.executed, 12);
    EXPECT_EQ(result.failed, 0);
    EXPECT_TRUE(err.str().empty());

    std::string text = out.str();
    EXPECT_NE(text.find("Booked token=1000 patient=1 doctor=1 slot=102"), std::string::npos);
    EXPECT_NE(text.find("Served EMERGENCY token=1002 patient=3"), std::string::npos);
    EXPECT_NE(text.find("Undid serving of routine token 1000"), std::string::npos);
    EXPECT_NE(text.find("patient 3: 1"), std::string::npos);
    EXPECT_EQ(reportServedVsPending(clinic).served, 1);
    EXPECT_EQ(reportServedVsPending(clinic).pending, 2);
}

TEST(CommandScript, ReportsMalformedLinesAndContinues) {
    Clinic clinic(10);
    std::istringstream script(
        "fly 1\n"
        "book one 1\n"
        "book 1 1\n"
        "serve now\n");
    std::ostringstream out;
    std::ostringstream err;
    ScriptResult result = runScript(clinic, script, out, err);
    EXPECT_EQ(result.executed, 1);
    EXPECT_EQ(result.failed, 3);
    EXPECT_NE(err.str().find("line 1: unknown command: fly"), std::string::npos);
    EXPECT_NE(err.str().find("line 2: not a number: one"), std::string::npos);
    EXPECT_NE(out.str().find("Booking failed: NOT_FOUND"), std::string::npos);
}

TEST(CommandScript, UndoOnFreshClinic) {
    Clinic clinic(2);
    std::ostringstream out;
    std::string err;
    ASSERT_TRUE(executeCommand(clinic, "undo", out, err));
    EXPECT_EQ(out.str(), "Nothing to undo\n");
}

TEST(CommandScript, ReportToBrokenStreamNamesTheFailure) {
    Clinic clinic(2);
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    std::string err;
    EXPECT_FALSE(executeCommand(clinic, "report", out, err));
    EXPECT_EQ(err, "summary output failed");
}

TEST(CommandScript, HistoryListsServedVisits) {
    Clinic clinic(4);
    std::ostringstream out;
    std::string err;
    ASSERT_TRUE(executeCommand(clinic, "triage 5 1", out, err)) << err;
    ASSERT_TRUE(executeCommand(clinic, "serve", out, err)) << err;
    out.str("");
    ASSERT_TRUE(executeCommand(clinic, "history 5", out, err)) << err;
    EXPECT_EQ(out.str(), "patient 5: token=1000 type=EMERGENCY doctor=-1\n");
    out.str("");
    ASSERT_TRUE(executeCommand(clinic, "history 6", out, err)) << err;
    EXPECT_EQ(out.str(), "patient 6: no visits\n");
}

TEST(CommandScript, TriageReportsExhaustedIds) {
    Clinic clinic(4, std::numeric_limits<int>::max());
    std::ostringstream out;
    std::string err;
    ASSERT_TRUE(executeCommand(clinic, "triage 1 1", out, err)) << err;
    ASSERT_TRUE(executeCommand(clinic, "triage 2 1", out, err)) << err;
    EXPECT_NE(out.str().find("Triage failed: EXHAUSTED"), std::string::npos);
}

TEST(Workload, DemoServesTriageThenRoutine) {
    Clinic clinic(20);
    std::ostringstream out;
    runDemo(clinic, out);
    std::string text = out.str();
    EXPECT_NE(text.find("Served: token=1002 patient=3"), std::string::npos);
    EXPECT_NE(text.find("Served: token=1000 patient=1"), std::string::npos);
    EXPECT_NE(text.find("Undo result: Undid serving of routine token 1000"), std::string::npos);
    EXPECT_EQ(reportServedVsPending(clinic).served, 1);
    EXPECT_EQ(reportServedVsPending(clinic).pending, 2);
}

TEST(Workload, SimulationIsReproducibleForASeed) {
    Config cfg{};
    applyConfigDefaults(cfg);
    cfg.simulateSteps = 80;

    Clinic first(cfg);
    Clinic second(cfg);
    std::ostringstream out1;
    std::ostringstream out2;
    EXPECT_EQ(runSimulation(first, cfg, out1), 80);
    runSimulation(second, cfg, out2);
    EXPECT_EQ(out1.str(), out2.str());
    EXPECT_EQ(first.served().size(), second.served().size());
    EXPECT_EQ(first.routineQueue().size(), second.routineQueue().size());
    EXPECT_EQ(first.triage().size(), second.triage().size());
}
