#include "ui_anim.hpp"
#include <algorithm>
#include <cmath>

// ===========================================================
// Update fade state toward its target
// ===========================================================
void updateFade(FadeAnim& state, bool active, float dtSeconds, float timeConstant) {
    float target = active ? 1.f : 0.f;

    // Avoid divide-by-zero and clamp dt
    if (dtSeconds <= 0.f) dtSeconds = 0.016f;
    if (timeConstant <= 0.f) timeConstant = 0.08f;

    // Exponential approach: new = target + (current - target) * exp(-dt / tau)
    float k = std::exp(-dtSeconds / timeConstant);
    state.value = target + (state.value - target) * k;

    // Snap small deltas to target to avoid tiny residuals
    if (std::fabs(state.value - target) < 0.001f) state.value = target;
}

float blendAlpha(float idleAlpha, float hotAlpha, float t) {
    t = std::clamp(t, 0.f, 1.f);
    return idleAlpha + (hotAlpha - idleAlpha) * t;
}
