#pragma once

struct ImageObject;

// ImGui widgets for every parameter listed by obj.getParams(),
// returns true if one of them was changed
bool displayParams(ImageObject& obj);
