#pragma once
// stack_validation.h
// Advisory structural checks for a Stack.
//
// Validation never throws and never blocks anything by itself: a Stack may
// legally exist in an invalid state. Callers run it explicitly (before
// compiling, or to surface editor hints) and decide what to do with it.

#include "stack.h"

#include <string>
#include <vector>

struct StackIssue {
    std::string entry_id;   // entry the issue is anchored to; empty for stack-wide issues
    std::string message;
};

struct StackValidation {
    bool                    valid = true;   // errors.empty()
    std::vector<StackIssue> errors;
    std::vector<StackIssue> warnings;
};

/// Checks, by mode:
///   all       empty stack (warning), duplicate entry ids (error)
///   serial    dead ends between neighbours (error), first-port type mismatch
///             (error) or adapter needed (warning)
///   parallel  input-port count differing from the first entry (warning)
///   layer     active entry with mix 0 (warning)
///   tabs      selected tab that is not in the stack (warning)
StackValidation validate_stack(const Stack& stack);
