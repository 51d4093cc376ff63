/** Camshaft wheel described by its list of edges.
* Each edge toggles the signal. Up to CAM_MAX_EDGES edges per engine cycle, angles relative to the first crank gap.
* @defgroup wheel_cam Camshaft edge list
* @{
*/
uint8_t camEdgeCount(const camWheel_t &cam)
{
  uint8_t count = 0;
  while( (count < CAM_MAX_EDGES) && (cam.edgeAngles[count] >= 0) ) { count++; }
  return count;
}

uint8_t validateCamWheel(const camWheel_t &cam)
{
  uint8_t usedEdges = camEdgeCount(cam);

  for(uint8_t x = 0; x < usedEdges; x++)
  {
    if(cam.edgeAngles[x] >= (int16_t)PULSE_TRAIN_LEN) { return ERR_CAM_EDGE_RANGE; }
    if( (x > 0U) && (cam.edgeAngles[x] <= cam.edgeAngles[x-1U]) ) { return ERR_CAM_EDGE_ORDER; }
  }
  return ERR_NONE;
}

uint8_t camWheelSetup(camWheel_t &cam, Level firstLevel, const int16_t *edges, uint8_t edgeCount)
{
  if(edgeCount > CAM_MAX_EDGES) { return ERR_CAM_EDGE_COUNT; }
  if( (edges == nullptr) && (edgeCount > 0U) ) { return ERR_CAM_EDGE_COUNT; }

  cam.firstLevel = firstLevel;
  for(uint8_t x = 0; x < CAM_MAX_EDGES; x++)
  {
    cam.edgeAngles[x] = (x < edgeCount) ? edges[x] : (int16_t)CAM_EDGE_UNUSED;
  }

  //A sentinel inside the list would silently drop the edges after it
  for(uint8_t x = 0; x < edgeCount; x++)
  {
    if(edges[x] < 0) { return ERR_CAM_EDGE_RANGE; }
  }

  return validateCamWheel(cam);
}

void camStateInit(camState_t &state, const camWheel_t &cam)
{
  state.level = cam.firstLevel;
  state.edgeIndex = 0;
  state.edgeAngles = cam.edgeAngles;
}
/** @} */
