#include "clinic_fixture.hpp"

TEST_F(ClinicTest, UndoOnEmptyLogIsANoOp) {
    std::string description;
    EXPECT_EQ(clinic.undoLast(description), ClinicStatus::Empty);
    EXPECT_EQ(description, "Nothing to undo");
    EXPECT_TRUE(clinic.routineQueue().empty());
    EXPECT_TRUE(clinic.triage().empty());
    EXPECT_TRUE(clinic.served().empty());
}

TEST_F(ClinicTest, UndoBookRestoresPriorState) {
    Token t;
    ASSERT_EQ(clinic.bookRoutine(1, 1, t), ClinicStatus::Ok);
    std::string description;
    ASSERT_EQ(clinic.undoLast(description), ClinicStatus::Ok);
    EXPECT_EQ(description, "Undid booking token " + std::to_string(t.tokenId));
    EXPECT_TRUE(clinic.routineQueue().empty());
    EXPECT_FALSE(clinic.routineQueue().contains(t.tokenId));
    EXPECT_EQ(slotStatus(1, 101), SlotStatus::Free);
    EXPECT_EQ(slotStatus(1, 102), SlotStatus::Free);
    EXPECT_TRUE(clinic.undoLog().empty());
}

TEST_F(ClinicTest, UndoCancelRebooksAndRequeues) {
    Token t, served;
    ASSERT_EQ(clinic.bookRoutine(1, 1, t), ClinicStatus::Ok);
    ASSERT_TRUE(clinic.cancelBooking(t.tokenId));
    EXPECT_EQ(slotStatus(1, t.slotId), SlotStatus::Free);

    std::string description;
    ASSERT_EQ(clinic.undoLast(description), ClinicStatus::Ok);
    EXPECT_NE(description.find("rebooked"), std::string::npos);
    EXPECT_EQ(slotStatus(1, t.slotId), SlotStatus::Booked);
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    EXPECT_EQ(served.tokenId, t.tokenId);
}

TEST_F(ClinicTest, UndoCancelRequeuesAtTail) {
    Token t1, t2;
    ASSERT_EQ(clinic.bookRoutine(1, 1, t1), ClinicStatus::Ok);
    ASSERT_EQ(clinic.bookRoutine(2, 1, t2), ClinicStatus::Ok);
    ASSERT_TRUE(clinic.cancelBooking(t1.tokenId));
    std::string description;
    ASSERT_EQ(clinic.undoLast(description), ClinicStatus::Ok);
    EXPECT_EQ(queuedIds(), (std::vector<int>{t2.tokenId, t1.tokenId}));
}

TEST_F(ClinicTest, UndoServeRoutineRestoresHeadPosition) {
    Token t1, t2, served;
    ASSERT_EQ(clinic.bookRoutine(1, 1, t1), ClinicStatus::Ok);
    ASSERT_EQ(clinic.bookRoutine(2, 1, t2), ClinicStatus::Ok);
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    EXPECT_EQ(served.tokenId, t1.tokenId);

    std::string description;
    ASSERT_EQ(clinic.undoLast(description), ClinicStatus::Ok);
    EXPECT_EQ(description, "Undid serving of routine token " + std::to_string(t1.tokenId));
    EXPECT_EQ(queuedIds(), (std::vector<int>{t1.tokenId, t2.tokenId}));
    EXPECT_TRUE(clinic.served().empty());
    EXPECT_TRUE(clinic.visitHistory(1).empty());
    EXPECT_EQ(slotStatus(1, t1.slotId), SlotStatus::Booked);
}

TEST_F(ClinicTest, UndoServeTriageRestoresPatient) {
    admitEmergency(3, 1, 1);
    Token served;
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    EXPECT_EQ(served.patientId, 3);

    std::string description;
    ASSERT_EQ(clinic.undoLast(description), ClinicStatus::Ok);
    EXPECT_NE(description.find("Undid serving"), std::string::npos);
    EXPECT_TRUE(clinic.served().empty());
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    EXPECT_EQ(served.patientId, 3);
}

TEST_F(ClinicTest, UndoServeTriageKeepsOriginalSeverity) {
    Token low = admitEmergency(1, 5);
    Token served;
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    EXPECT_EQ(served.tokenId, low.tokenId);
    // Restored with severity 5, so a later severity-1 case still goes first.
    std::string description;
    ASSERT_EQ(clinic.undoLast(description), ClinicStatus::Ok);
    Token urgent = admitEmergency(2, 1);

    TriageEntry head;
    ASSERT_TRUE(clinic.triage().peek(head));
    EXPECT_EQ(head.token.tokenId, urgent.tokenId);
    std::vector<TriageEntry> ordered = clinic.triage().snapshot();
    ASSERT_EQ(ordered.size(), 2u);
    EXPECT_EQ(ordered[1].token.tokenId, low.tokenId);
    EXPECT_EQ(ordered[1].severity, 5);
}

TEST_F(ClinicTest, UndoServeTriageRegainsTiePosition) {
    Token a = admitEmergency(1, 2);
    Token b = admitEmergency(2, 2);
    Token served;
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    EXPECT_EQ(served.tokenId, a.tokenId);
    std::string description;
    ASSERT_EQ(clinic.undoLast(description), ClinicStatus::Ok);
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    EXPECT_EQ(served.tokenId, a.tokenId);
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    EXPECT_EQ(served.tokenId, b.tokenId);
}

TEST_F(ClinicTest, UndoTriageInsertRemovesToken) {
    Token keep = admitEmergency(1, 3);
    Token dropped = admitEmergency(2, 0);
    std::string description;
    ASSERT_EQ(clinic.undoLast(description), ClinicStatus::Ok);
    EXPECT_EQ(description, "Undid triage insert " + std::to_string(dropped.tokenId));
    EXPECT_EQ(clinic.triage().size(), 1u);
    TriageEntry head;
    ASSERT_TRUE(clinic.triage().peek(head));
    EXPECT_EQ(head.token.tokenId, keep.tokenId);
}

TEST_F(ClinicTest, RepeatedUndoUnwindsEverything) {
    Token t1, t2, served;
    ASSERT_EQ(clinic.bookRoutine(1, 1, t1), ClinicStatus::Ok);
    ASSERT_EQ(clinic.bookRoutine(2, 1, t2), ClinicStatus::Ok);
    admitEmergency(3, 0);
    ASSERT_TRUE(clinic.cancelBooking(t2.tokenId));
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    ASSERT_EQ(clinic.serveNext(served), ClinicStatus::Ok);
    EXPECT_EQ(clinic.undoLog().size(), 6u);

    std::string description;
    for (int i = 0; i < 6; ++i) {
        ASSERT_EQ(clinic.undoLast(description), ClinicStatus::Ok) << description;
    }
    EXPECT_EQ(clinic.undoLast(description), ClinicStatus::Empty);
    EXPECT_TRUE(clinic.routineQueue().empty());
    EXPECT_TRUE(clinic.triage().empty());
    EXPECT_TRUE(clinic.served().empty());
    EXPECT_EQ(slotStatus(1, 101), SlotStatus::Free);
    EXPECT_EQ(slotStatus(1, 102), SlotStatus::Free);
    EXPECT_TRUE(clinic.visitHistory(1).empty());
    EXPECT_TRUE(clinic.visitHistory(3).empty());
}
