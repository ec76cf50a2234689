#include "internal/model/payment_state.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace blueshare::model {

void Transition(PaymentState& current, PaymentState next) {
  if (!CanTransition(current, next)) {
    throw blueshare::util::InvalidState("payment cannot move from " + std::string(ToString(current)) + " to " +
                                        std::string(ToString(next)));
  }
  current = next;
}

} // namespace blueshare::model
