#ifndef RELAY_HPP
#define RELAY_HPP

#include "connection.hpp"

// Copies bytes in both directions between local and tunnel until either
// direction reaches end of stream or fails. Both connections are closed
// before returning. Rethrows the error of the direction that ended first; an
// error from the other direction is only logged at debug level.
void relay_bidirectional(Connection &local, Connection &tunnel);

#endif
