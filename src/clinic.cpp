#include "clinic.hpp"

#include "util/clock.hpp"
#include "util/error.hpp"

#include <iterator>
#include <limits>

namespace {
std::string visitLine(const Token& token) {
    return "token=" + std::to_string(token.tokenId) +
           " type=" + tokenTypeName(token.type) +
           " doctor=" + std::to_string(token.doctorId);
}

std::string describeToken(const Token& token) {
    std::string text = "token=" + std::to_string(token.tokenId) +
                       " patient=" + std::to_string(token.patientId) +
                       " doctor=" + std::to_string(token.doctorId);
    if (token.hasSlot()) {
        text += " slot=" + std::to_string(token.slotId);
    }
    return text;
}
} // namespace

Clinic::Clinic(std::size_t queueCapacity, int firstTokenId)
    : routine_(queueCapacity),
      nextTokenId_(firstTokenId),
      logger_(nullptr),
      logSeq_(0) {}

Clinic::Clinic(const Config& config)
    : Clinic(static_cast<std::size_t>(config.queueCapacity), config.firstTokenId) {}

void Clinic::attachLogger(Logger* logger) {
    logger_ = logger;
}

const Patient& Clinic::registerPatient(int id, const std::string& name, int age, int severity) {
    Patient p;
    p.id = id;
    p.name = name;
    p.age = age;
    p.severity = severity;
    const Patient& stored = patients_.upsert(p);
    log(Role::Registry, "Patient registered id=" + std::to_string(id) + " age=" + std::to_string(age));
    return stored;
}

const Patient* Clinic::findPatient(int id) const {
    return patients_.get(id);
}

ClinicStatus Clinic::addDoctor(int id, const std::string& name, const std::string& specialization) {
    if (schedules_.count(id) != 0) {
        log(Role::Registry, "Doctor rejected id=" + std::to_string(id) + " status=DUPLICATE");
        return ClinicStatus::Duplicate;
    }
    Doctor d;
    d.id = id;
    d.name = name;
    d.specialization = specialization;
    schedules_.emplace(id, DoctorSchedule(d));
    log(Role::Registry, "Doctor added id=" + std::to_string(id) + " spec=" + specialization);
    return ClinicStatus::Ok;
}

const Doctor* Clinic::findDoctor(int id) const {
    const DoctorSchedule* sched = findSchedule(id);
    return sched ? &sched->doctor() : nullptr;
}

const DoctorSchedule* Clinic::findSchedule(int doctorId) const {
    auto it = schedules_.find(doctorId);
    return it == schedules_.end() ? nullptr : &it->second;
}

ClinicStatus Clinic::addSlotToDoctor(int doctorId, int slotId, const std::string& start, const std::string& end) {
    DoctorSchedule* sched = mutableSchedule(doctorId);
    if (!sched) {
        log(Role::Registry, "Slot rejected doctor=" + std::to_string(doctorId) + " status=NOT_FOUND");
        return ClinicStatus::NotFound;
    }
    if (!sched->addSlot(slotId, start, end)) {
        log(Role::Registry, "Slot rejected slot=" + std::to_string(slotId) + " status=DUPLICATE");
        return ClinicStatus::Duplicate;
    }
    log(Role::Registry, "Slot added doctor=" + std::to_string(doctorId) + " slot=" + std::to_string(slotId) +
                        " " + start + "-" + end);
    return ClinicStatus::Ok;
}

ClinicStatus Clinic::bookRoutine(int patientId, int doctorId, Token& out) {
    if (!patients_.get(patientId)) {
        log(Role::Booking, "Booking failed patient=" + std::to_string(patientId) + " status=NOT_FOUND");
        return ClinicStatus::NotFound;
    }
    DoctorSchedule* sched = mutableSchedule(doctorId);
    if (!sched) {
        log(Role::Booking, "Booking failed doctor=" + std::to_string(doctorId) + " status=NOT_FOUND");
        return ClinicStatus::NotFound;
    }
    if (!tokenIdsLeft()) {
        log(Role::Booking, "Booking failed patient=" + std::to_string(patientId) + " status=EXHAUSTED");
        return ClinicStatus::Exhausted;
    }
    Slot slot;
    if (!sched->bookNextFree(slot)) {
        log(Role::Booking, "Booking failed doctor=" + std::to_string(doctorId) + " status=NO_CAPACITY");
        return ClinicStatus::NoCapacity;
    }

    Token token;
    token.tokenId = static_cast<int>(nextTokenId_);
    token.patientId = patientId;
    token.doctorId = doctorId;
    token.slotId = slot.id;
    token.type = TokenType::Routine;
    token.timestampMs = wallClockMs();
    if (!routine_.enqueue(token)) {
        // Roll back so the slot is not stranded as BOOKED without a token.
        sched->cancelSlot(slot.id);
        log(Role::Booking, "Booking rolled back slot=" + std::to_string(slot.id) + " status=QUEUE_FULL");
        return ClinicStatus::QueueFull;
    }
    ++nextTokenId_;

    UndoRecord record;
    record.kind = UndoKind::Book;
    record.token = token;
    undo_.push(record);
    out = token;
    log(Role::Booking, "Booked " + describeToken(token));
    return ClinicStatus::Ok;
}

bool Clinic::cancelBooking(int tokenId) {
    Token removed;
    if (!routine_.removeById(tokenId, &removed)) {
        log(Role::Booking, "Cancel ignored token=" + std::to_string(tokenId) + " not queued");
        return false;
    }
    DoctorSchedule* sched = mutableSchedule(removed.doctorId);
    if (sched && removed.hasSlot()) {
        sched->cancelSlot(removed.slotId);
    }
    UndoRecord record;
    record.kind = UndoKind::Cancel;
    record.token = removed;
    undo_.push(record);
    log(Role::Booking, "Cancelled " + describeToken(removed));
    return true;
}

ClinicStatus Clinic::triageInsert(int patientId, int severity, Token& out, int doctorId) {
    if (!tokenIdsLeft()) {
        log(Role::Triage, "Triage rejected patient=" + std::to_string(patientId) + " status=EXHAUSTED");
        return ClinicStatus::Exhausted;
    }
    Token token;
    token.tokenId = static_cast<int>(nextTokenId_++);
    token.patientId = patientId;
    token.doctorId = doctorId;
    token.slotId = -1;
    token.type = TokenType::Emergency;
    token.timestampMs = wallClockMs();
    TriageEntry entry = triage_.insert(token, severity);

    UndoRecord record;
    record.kind = UndoKind::TriageInsert;
    record.token = token;
    record.severity = entry.severity;
    record.sequence = entry.sequence;
    undo_.push(record);
    out = token;
    log(Role::Triage, "Triage inserted " + describeToken(token) + " severity=" + std::to_string(severity));
    return ClinicStatus::Ok;
}

ClinicStatus Clinic::serveNext(Token& out) {
    UndoRecord record;
    TriageEntry entry;
    if (triage_.extractMin(entry)) {
        record.kind = UndoKind::ServeTriage;
        record.token = entry.token;
        record.severity = entry.severity;
        record.sequence = entry.sequence;
    } else if (routine_.dequeue(record.token)) {
        record.kind = UndoKind::ServeRoutine;
    } else {
        log(Role::Service, "Nothing to serve");
        return ClinicStatus::Empty;
    }
    served_.push_back(record.token);
    undo_.push(record);
    out = record.token;
    log(Role::Service, "Served " + tokenTypeName(out.type) + " " + describeToken(out));
    return ClinicStatus::Ok;
}

ClinicStatus Clinic::undoLast(std::string& description) {
    UndoRecord record;
    if (!undo_.pop(record)) {
        description = "Nothing to undo";
        log(Role::Undo, description);
        return ClinicStatus::Empty;
    }

    ClinicStatus status = ClinicStatus::InvalidAction;
    switch (record.kind) {
        case UndoKind::Book: status = undoBook(record, description); break;
        case UndoKind::Cancel: status = undoCancel(record, description); break;
        case UndoKind::ServeRoutine: status = undoServeRoutine(record, description); break;
        case UndoKind::ServeTriage: status = undoServeTriage(record, description); break;
        case UndoKind::TriageInsert: status = undoTriageInsert(record, description); break;
        default:
            description = "Unknown action to undo";
            logError("undo record with unknown kind " + std::to_string(static_cast<int>(record.kind)));
            break;
    }
    log(Role::Undo, undoKindName(record.kind) + " " + description + " status=" + statusName(status));
    return status;
}

ClinicStatus Clinic::undoBook(const UndoRecord& record, std::string& description) {
    const Token& token = record.token;
    if (!routine_.removeById(token.tokenId)) {
        description = "Could not find token to undo";
        return ClinicStatus::NotFound;
    }
    DoctorSchedule* sched = mutableSchedule(token.doctorId);
    if (sched && token.hasSlot()) {
        sched->cancelSlot(token.slotId);
    }
    description = "Undid booking token " + std::to_string(token.tokenId);
    return ClinicStatus::Ok;
}

ClinicStatus Clinic::undoCancel(const UndoRecord& record, std::string& description) {
    const Token& token = record.token;
    if (!routine_.enqueue(token)) {
        undo_.push(record);
        description = "Could not rebook token " + std::to_string(token.tokenId) + ": queue full";
        return ClinicStatus::QueueFull;
    }
    DoctorSchedule* sched = mutableSchedule(token.doctorId);
    if (sched && token.hasSlot()) {
        sched->rebookSlot(token.slotId);
    }
    description = "Undid cancellation: rebooked token " + std::to_string(token.tokenId);
    return ClinicStatus::Ok;
}

ClinicStatus Clinic::undoServeRoutine(const UndoRecord& record, std::string& description) {
    const Token& token = record.token;
    // Undo is LIFO, so the served token was the head when it left the queue.
    if (!routine_.pushFront(token)) {
        undo_.push(record);
        description = "Could not requeue token " + std::to_string(token.tokenId) + ": queue full";
        return ClinicStatus::QueueFull;
    }
    if (!removeServed(token.tokenId)) {
        logError("served list lost token " + std::to_string(token.tokenId));
    }
    description = "Undid serving of routine token " + std::to_string(token.tokenId);
    return ClinicStatus::Ok;
}

ClinicStatus Clinic::undoServeTriage(const UndoRecord& record, std::string& description) {
    TriageEntry entry;
    entry.token = record.token;
    entry.severity = record.severity;
    entry.sequence = record.sequence;
    triage_.restore(entry);
    if (!removeServed(record.token.tokenId)) {
        logError("served list lost token " + std::to_string(record.token.tokenId));
    }
    description = "Undid serving of triage token " + std::to_string(record.token.tokenId);
    return ClinicStatus::Ok;
}

ClinicStatus Clinic::undoTriageInsert(const UndoRecord& record, std::string& description) {
    if (!triage_.removeById(record.token.tokenId)) {
        description = "Could not find triage token to undo";
        return ClinicStatus::NotFound;
    }
    description = "Undid triage insert " + std::to_string(record.token.tokenId);
    return ClinicStatus::Ok;
}

std::vector<std::string> Clinic::visitHistory(int patientId) const {
    std::vector<std::string> lines;
    for (const Token& t : served_) {
        if (t.patientId == patientId) {
            lines.push_back(visitLine(t));
        }
    }
    return lines;
}

LogMetrics Clinic::metrics() const {
    LogMetrics m;
    m.routineQueueLen = static_cast<int>(routine_.size());
    m.routineQueueCapacity = static_cast<int>(routine_.capacity());
    m.triageLen = static_cast<int>(triage_.size());
    m.undoDepth = static_cast<int>(undo_.size());
    m.servedCount = static_cast<int>(served_.size());
    return m;
}

void Clinic::note(Role role, const std::string& text) {
    log(role, text);
}

DoctorSchedule* Clinic::mutableSchedule(int doctorId) {
    auto it = schedules_.find(doctorId);
    return it == schedules_.end() ? nullptr : &it->second;
}

bool Clinic::removeServed(int tokenId) {
    for (auto it = served_.rbegin(); it != served_.rend(); ++it) {
        if (it->tokenId == tokenId) {
            served_.erase(std::next(it).base());
            return true;
        }
    }
    return false;
}

bool Clinic::tokenIdsLeft() const {
    return nextTokenId_ <= std::numeric_limits<int>::max();
}

void Clinic::log(Role role, const std::string& text) {
    if (!logger_ || !logger_->isOpen()) {
        return;
    }
    LogMetrics m = metrics();
    if (!logger_->logLine(formatLogLine(++logSeq_, role, &m, text))) {
        logError("event log disabled after write failure");
        logger_ = nullptr;
    }
}
