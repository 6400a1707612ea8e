// Repository: Intermission
// Component: Controller Suspension Contract
// Purpose: The only surface through which the countdown touches an input
//          controller (player movement, interaction handler, ...).
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_COUNTDOWN_ICONTROLLABLE_HPP_
#define INTERMISSION_COUNTDOWN_ICONTROLLABLE_HPP_

#include <string>

namespace intermission::countdown {

class IControllable {
 public:
  virtual ~IControllable() = default;

  virtual bool IsEnabled() const = 0;
  virtual void SetEnabled(bool enabled) = 0;

  // Used in log lines only.
  virtual std::string Name() const { return "controller"; }
};

}  // namespace intermission::countdown

#endif  // INTERMISSION_COUNTDOWN_ICONTROLLABLE_HPP_
