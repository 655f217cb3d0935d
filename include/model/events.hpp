#pragma once

#include "patient.hpp"
#include "types.hpp"

// One entry of the undo log. severity/sequence are only meaningful for
// ServeTriage and TriageInsert records.
struct UndoRecord {
    UndoKind  kind{UndoKind::Book};
    Token     token;
    int       severity{0};
    long long sequence{-1};
};
