#pragma once

namespace surge {

// What a push source does with items the subscriber has not asked for yet.
enum class backpressure_strategy {
  buffer,        // unbounded queue
  drop,          // discard while there is no outstanding demand
  drop_latest,   // bounded queue; a full queue discards the arriving item
  drop_oldest,   // bounded queue; a full queue evicts its oldest item
  error          // bounded queue; overflow terminates with missing_backpressure
};

} // namespace surge
