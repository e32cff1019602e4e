#include "RunSignatures.h"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>

namespace ssd {

namespace {

inline std::uint32_t addU32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32Update(h, &v, sizeof(v));
}

inline std::uint32_t addI32(std::uint32_t h, std::int32_t v) {
    return fnv1a32Update(h, &v, sizeof(v));
}

inline std::uint32_t addU64(std::uint32_t h, std::uint64_t v) {
    return fnv1a32Update(h, &v, sizeof(v));
}

inline std::uint32_t addF64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32Update(h, &bits, sizeof(bits));
}

inline std::uint32_t addVec(std::uint32_t h, const std::vector<double>& v) {
    h = addU32(h, static_cast<std::uint32_t>(v.size()));
    for (double x : v) h = addF64(h, x);
    return h;
}

} // namespace

std::uint32_t fnv1a32Begin() { return 2166136261u; }

std::uint32_t fnv1a32Update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

std::uint32_t crc32Update(std::uint32_t crc, const void* data, std::size_t len) {
    static const auto table = [] {
        std::array<std::uint32_t, 256> t{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            t[i] = c;
        }
        return t;
    }();

    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    std::uint32_t c = crc ^ 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        c = table[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFFu;
}

std::uint32_t paramsHash(const CoreParams& p) {
    std::uint32_t h = fnv1a32Begin();
    h = addI32(h, p.num_layers);
    h = addVec(h, p.R_values);
    h = addVec(h, p.gamma_values);
    h = addVec(h, p.beta_values);
    h = addVec(h, p.eta_values);
    h = addVec(h, p.lambda_values);
    h = addVec(h, p.kappa_min_values);
    h = addVec(h, p.Theta_values);

    h = addU32(h, p.enable_dynamic_theta ? 1u : 0u);
    h = addF64(h, p.theta_sensitivity);
    h = addU32(h, p.enable_stochastic_leap ? 1u : 0u);
    h = addF64(h, p.temperature_T);
    h = addF64(h, p.G0);
    h = addF64(h, p.g);

    h = addU32(h, p.log_align.enabled ? 1u : 0u);
    h = addF64(h, p.log_align.alpha0);
    h = addF64(h, p.log_align.log_base);
    h = addF64(h, p.log_align.ema_tau);
    h = addF64(h, p.log_align.epsilon);
    h = addF64(h, p.log_align.alpha_min);
    h = addF64(h, p.log_align.alpha_max);
    h = addI32(h, p.log_align.warmup_steps);

    h = addU32(h, p.residual.use_log_residual ? 1u : 0u);
    h = addU32(h, p.residual.zeta_auto_estimate ? 1u : 0u);
    h = addF64(h, p.residual.zeta_init);
    h = addF64(h, p.residual.zeta_min);
    h = addF64(h, p.residual.zeta_max);
    h = addF64(h, p.residual.zeta_decay);

    h = addF64(h, p.leap_energy_retention);
    h = addF64(h, p.leap_kappa_increment);
    return h;
}

std::uint32_t stateDigest(const CoreState& s) {
    std::uint32_t h = fnv1a32Begin();
    h = addVec(h, s.E());
    h = addVec(h, s.kappa());
    h = addF64(h, s.t());
    h = addU64(h, s.stepCount());
    h = addF64(h, s.gain().ema_norm);
    h = addF64(h, s.gain().alpha_t);
    h = addF64(h, s.gain().zeta);
    h = addU32(h, static_cast<std::uint32_t>(s.leapHistory().size()));
    for (const LeapRecord& rec : s.leapHistory()) {
        h = addF64(h, rec.t_s);
        h = addI32(h, rec.kind);
        h = addI32(h, rec.layer);
    }
    return h;
}

int exportConfigText(const CoreParams& p, char* buf, int cap) {
    if (!buf || cap <= 0) return 0;
    buf[0] = '\0';

    int n = 0;
    auto app = [&](const char* fmt, auto... args) {
        if (n >= cap) return;
        const int w = std::snprintf(buf + n, static_cast<std::size_t>(cap - n), fmt, args...);
        if (w > 0) n += std::min(w, cap - n);
    };
    auto appVec = [&](const char* name, const std::vector<double>& v) {
        app("  %s=[", name);
        for (std::size_t i = 0; i < v.size(); ++i) {
            app(i == 0 ? "%.9g" : ",%.9g", v[i]);
        }
        app("]\n");
    };

    app("CoreParams\n");
    app("  num_layers=%d\n", p.num_layers);
    appVec("R_values", p.R_values);
    appVec("gamma_values", p.gamma_values);
    appVec("beta_values", p.beta_values);
    appVec("eta_values", p.eta_values);
    appVec("lambda_values", p.lambda_values);
    appVec("kappa_min_values", p.kappa_min_values);
    appVec("Theta_values", p.Theta_values);
    app("  enable_dynamic_theta=%d\n", p.enable_dynamic_theta ? 1 : 0);
    app("  theta_sensitivity=%.9g\n", p.theta_sensitivity);
    app("  enable_stochastic_leap=%d\n", p.enable_stochastic_leap ? 1 : 0);
    app("  temperature_T=%.9g\n", p.temperature_T);
    app("  G0=%.9g\n", p.G0);
    app("  g=%.9g\n", p.g);
    app("  leap_energy_retention=%.9g\n", p.leap_energy_retention);
    app("  leap_kappa_increment=%.9g\n", p.leap_kappa_increment);

    app("LogAlignParams\n");
    app("  enabled=%d\n", p.log_align.enabled ? 1 : 0);
    app("  alpha0=%.9g\n", p.log_align.alpha0);
    app("  log_base=%.9g\n", p.log_align.log_base);
    app("  ema_tau=%.9g\n", p.log_align.ema_tau);
    app("  epsilon=%.9g\n", p.log_align.epsilon);
    app("  alpha_min=%.9g\n", p.log_align.alpha_min);
    app("  alpha_max=%.9g\n", p.log_align.alpha_max);
    app("  warmup_steps=%d\n", p.log_align.warmup_steps);

    app("ResidualParams\n");
    app("  use_log_residual=%d\n", p.residual.use_log_residual ? 1 : 0);
    app("  zeta_auto_estimate=%d\n", p.residual.zeta_auto_estimate ? 1 : 0);
    app("  zeta_init=%.9g\n", p.residual.zeta_init);
    app("  zeta_min=%.9g\n", p.residual.zeta_min);
    app("  zeta_max=%.9g\n", p.residual.zeta_max);
    app("  zeta_decay=%.9g\n", p.residual.zeta_decay);

    app("  params_hash_u32=0x%08X\n", paramsHash(p));

    // Convenience: full export hash for copy/paste audits.
    const std::uint32_t export_hash = fnv1a32Update(fnv1a32Begin(), buf, std::strlen(buf));
    app("ExportTextHash(FNV-1a32)=0x%08X\n", export_hash);

    return std::min(n, cap);
}

} // namespace ssd
