#pragma once

#include "boolstab/errors.hpp"
#include "boolstab/utils.hpp"

#include <string>

namespace boolstab {

// Which transition directions are subject to stabilization.
//
//   Both        - false->true and true->false are both stabilized
//   TrueToFalse - only leaving true is stabilized; false->true is immediate
//   FalseToTrue - only leaving false is stabilized; true->false is immediate
//   None        - every report commits immediately
enum class BufferMode {
  Both,
  TrueToFalse,
  FalseToTrue,
  None
};

// The two possible changes of a boolean value.
enum class Transition {
  FalseToTrue,
  TrueToFalse
};

// Direction of a change that ends at `to`.
inline Transition transition_into(bool to) {
  return to ? Transition::FalseToTrue : Transition::TrueToFalse;
}

inline std::string buffer_mode_name(BufferMode m) {
  switch (m) {
    case BufferMode::Both: return "both";
    case BufferMode::TrueToFalse: return "true_to_false";
    case BufferMode::FalseToTrue: return "false_to_true";
    case BufferMode::None: return "none";
  }
  return "both";
}

inline std::string transition_name(Transition t) {
  switch (t) {
    case Transition::FalseToTrue: return "false_to_true";
    case Transition::TrueToFalse: return "true_to_false";
  }
  return "false_to_true";
}

inline BufferMode parse_buffer_mode(const std::string& s) {
  std::string t = to_lower(trim(s));
  for (char& c : t) {
    if (c == '-') c = '_';
  }

  if (t == "both") return BufferMode::Both;
  if (t == "true_to_false" || t == "t2f") return BufferMode::TrueToFalse;
  if (t == "false_to_true" || t == "f2t") return BufferMode::FalseToTrue;
  if (t == "none" || t == "off") return BufferMode::None;
  throw InvalidConfigurationError("Invalid buffer mode: '" + s +
                                  "' (expected both, true_to_false, false_to_true or none)");
}

// Whether `mode` stabilizes the change from `from` to `to`.
//
// Only meaningful when from != to; a report equal to the committed value is
// never a transition.
inline bool stabilizes(BufferMode mode, bool from, bool to) {
  switch (mode) {
    case BufferMode::Both: return true;
    case BufferMode::TrueToFalse: return from && !to;
    case BufferMode::FalseToTrue: return !from && to;
    case BufferMode::None: return false;
  }
  return true;
}

} // namespace boolstab
