#pragma once

#include <istream>
#include <ostream>
#include <string>

class Clinic;

struct ScriptResult {
    int executed{0};   // lines that ran a command
    int failed{0};     // malformed or unknown lines
};

/**
 * @brief Run one command line against the clinic.
 *
 * Commands: patient, doctor, slot, book, cancel, triage, serve, undo,
 * report, history, top. Operation outcomes (including NOT_FOUND etc.) are printed to
 * out; only malformed input returns false.
 *
 * @param err receives a description when the line cannot be executed.
 * @return true when the line was a well-formed command.
 */
bool executeCommand(Clinic& clinic, const std::string& line, std::ostream& out, std::string& err);

/**
 * @brief Execute every line of a script; blank lines and '#' comments are skipped.
 *        Failures are reported to errOut with their line number and the run continues.
 */
ScriptResult runScript(Clinic& clinic, std::istream& in, std::ostream& out, std::ostream& errOut);
