#ifndef WHEEL_CAM_H
#define WHEEL_CAM_H

/**
 * @brief Fill a cam wheel from an edge list
 *
 * The edges are copied and the remaining slots are padded with CAM_EDGE_UNUSED.
 *
 * @param edges Edge angles, strictly ascending
 * @param edgeCount Number of entries in edges
 * @return ERR_NONE, or the validation error (The wheel content is undefined in that case)
 */
uint8_t camWheelSetup(camWheel_t &cam, Level firstLevel, const int16_t *edges, uint8_t edgeCount);
uint8_t validateCamWheel(const camWheel_t &cam);
/** Number of edges in use (up to the first unused slot) */
uint8_t camEdgeCount(const camWheel_t &cam);

/** Cam signal tracker used by the pulse train generator */
struct camState_t {
  Level         level;
  uint8_t       edgeIndex;   //Next edge to be matched
  const int16_t *edgeAngles;
};

void camStateInit(camState_t &state, const camWheel_t &cam);

/** Apply the transition rule for `angle`. Must be called after the level for `angle` has been written. */
static inline void camStateStep(camState_t &state, uint16_t angle)
{
  if( (state.edgeIndex < CAM_MAX_EDGES) && (state.edgeAngles[state.edgeIndex] == (int16_t)angle) )
  {
    state.level = invertLevel(state.level);
    state.edgeIndex++;
  }
}

#endif
