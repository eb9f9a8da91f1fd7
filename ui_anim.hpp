#pragma once

// ===========================================================
// Hover / fade animation helpers
// ===========================================================

struct FadeAnim {
    float value = 0.f;   // 0 = idle, 1 = fully highlighted
};

// Move `state.value` toward 1 (active) or 0 (inactive).
// dtSeconds: time elapsed since last update (seconds).
// timeConstant: time to approach the target (seconds); smaller = faster.
void updateFade(FadeAnim& state, bool active, float dtSeconds = 0.016f, float timeConstant = 0.08f);

// Linear blend between two alpha levels by an animation value
float blendAlpha(float idleAlpha, float hotAlpha, float t);
