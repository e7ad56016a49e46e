// audit_chain.hpp
#ifndef RECONFUSION_AUDIT_CHAIN_HPP_
#define RECONFUSION_AUDIT_CHAIN_HPP_

#include <algorithm> // For std::min
#include <cstddef>   // For std::size_t
#include <cstdint>   // For std::int64_t
#include <iomanip>   // For std::setw, std::setfill
#include <map>
#include <memory>    // For std::unique_ptr
#include <sstream>   // For hex encoding
#include <stdexcept> // For std::runtime_error
#include <string>
#include <utility>   // For std::move
#include <variant>   // For std::visit over MetaValue
#include <vector>

#include <json/json.h>   // jsoncpp, for the canonical payload
#include <openssl/evp.h> // For EVP SHA-256

// Project-specific Headers
#include "common_types.hpp"

namespace reconfusion {

/**
 * @brief Compact, export-friendly view of one measurement used in a tick.
 * Full matrices are not stored; R is reduced to its trace.
 */
struct MeasurementSummary {
    std::string sensor_id;
    std::string type;
    double quality = 0.0;
    double latency_ms = 0.0;
    std::int64_t tick = 0;
    std::vector<double> z3; // First min(3, |z|) components of z
    double R_trace = 0.0;
    bool dropped = false;
    MetaMap meta;

    static MeasurementSummary from(const SensorMeasurement& m) {
        MeasurementSummary s;
        s.sensor_id = m.sensorId();
        s.type = toString(m.sensorType());
        s.quality = m.quality();
        s.latency_ms = m.latencyMs();
        s.tick = m.tick();
        const Eigen::Index n = std::min<Eigen::Index>(3, m.z().size());
        for (Eigen::Index i = 0; i < n; ++i) {
            s.z3.push_back(m.z()(i));
        }
        s.R_trace = m.R().trace();
        s.dropped = m.dropped();
        s.meta = m.meta();
        return s;
    }

    Json::Value toJson() const {
        Json::Value v(Json::objectValue);
        v["sensor_id"] = sensor_id;
        v["type"] = type;
        v["quality"] = quality;
        v["latency_ms"] = latency_ms;
        v["tick"] = Json::Int64(tick);
        Json::Value z(Json::arrayValue);
        for (double c : z3) {
            z.append(c);
        }
        v["z3"] = z;
        v["R_trace"] = R_trace;
        v["dropped"] = dropped;
        Json::Value meta_json(Json::objectValue);
        for (const auto& kv : meta) {
            std::visit([&](const auto& value) { meta_json[kv.first] = value; }, kv.second);
        }
        v["meta"] = meta_json;
        return v;
    }
};

struct FusedSummary {
    double lat = 0.0;
    double lon = 0.0;
    double altitude_m = 0.0;
    double velocity_mps = 0.0;
    double heading_deg = 0.0;
    double fusion_conf = 0.0;
    double surprise = 0.0;
    std::map<std::string, double> sensor_contrib;
    int used_meas_count = 0;

    static FusedSummary from(const FusedEstimate& f) {
        FusedSummary s;
        s.lat = f.lat();
        s.lon = f.lon();
        s.altitude_m = f.altitudeM();
        s.velocity_mps = f.velocityMps();
        s.heading_deg = f.headingDeg();
        s.fusion_conf = f.fusionConf();
        s.surprise = f.surprise();
        s.sensor_contrib = f.sensorContrib();
        s.used_meas_count = f.usedMeasCount();
        return s;
    }

    Json::Value toJson() const {
        Json::Value v(Json::objectValue);
        v["lat"] = lat;
        v["lon"] = lon;
        v["altitude_m"] = altitude_m;
        v["velocity_mps"] = velocity_mps;
        v["heading_deg"] = heading_deg;
        v["fusion_conf"] = fusion_conf;
        v["surprise"] = surprise;
        Json::Value contrib(Json::objectValue);
        for (const auto& kv : sensor_contrib) {
            contrib[kv.first] = kv.second;
        }
        v["sensor_contrib"] = contrib;
        v["used_meas_count"] = used_meas_count;
        return v;
    }
};

namespace detail {

/**
 * @brief Canonical serialization: sorted keys (Json::Value objects are ordered maps),
 * no whitespace, 17 significant digits so doubles survive the round trip.
 */
inline std::string canonicalJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["precision"] = 17;
    builder["precisionType"] = "significant";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

/**
 * @brief Lowercase hex SHA-256 of a byte string.
 * @throws std::runtime_error if the OpenSSL digest fails.
 */
inline std::string sha256Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("sha256Hex: EVP_MD_CTX_new failed.");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("sha256Hex: OpenSSL SHA-256 digest failed.");
    }
    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

} // namespace detail

/**
 * @brief One tamper-evident entry of the audit chain: which measurements a
 * tick used, what was fused from them, and the SHA-256 of the canonical
 * payload {"fused", "tick", "used", "utc"}.
 */
class AuditRecord {
public:
    static constexpr std::size_t kDigestHexLength = 64;

    /**
     * @throws std::runtime_error if tick is negative or the digest is not 64 hex characters.
     */
    AuditRecord(std::int64_t tick,
                std::string utc,
                std::vector<MeasurementSummary> used,
                FusedSummary fused,
                std::string sha256)
        : tick_(tick),
          utc_(std::move(utc)),
          used_(std::move(used)),
          fused_(std::move(fused)),
          sha256_(std::move(sha256)) {
        if (tick_ < 0) {
            throw std::runtime_error("AuditRecord: tick must be >= 0.");
        }
        if (sha256_.size() != kDigestHexLength ||
            sha256_.find_first_not_of("0123456789abcdef") != std::string::npos) {
            throw std::runtime_error("AuditRecord: sha256 must be 64 lowercase hex characters.");
        }
    }

    std::int64_t tick() const { return tick_; }
    const std::string& utc() const { return utc_; }
    const std::vector<MeasurementSummary>& usedMeasurements() const { return used_; }
    const FusedSummary& fusedOutput() const { return fused_; }
    const std::string& sha256() const { return sha256_; }

    /**
     * @brief The hashed payload.
     */
    Json::Value payload() const { return makePayload(tick_, utc_, used_, fused_); }

    static Json::Value makePayload(std::int64_t tick,
                                   const std::string& utc,
                                   const std::vector<MeasurementSummary>& used,
                                   const FusedSummary& fused) {
        Json::Value used_json(Json::arrayValue);
        for (const auto& s : used) {
            used_json.append(s.toJson());
        }
        Json::Value p(Json::objectValue);
        p["tick"] = Json::Int64(tick);
        p["utc"] = utc;
        p["used"] = used_json;
        p["fused"] = fused.toJson();
        return p;
    }

    /**
     * @brief Export form: the payload plus its digest.
     */
    Json::Value toJson() const {
        Json::Value v = payload();
        v["sha256"] = sha256_;
        return v;
    }

    /**
     * @brief Recomputes the digest from the stored payload.
     * @return True if the record has not been altered since it was built.
     */
    bool verify() const {
        return detail::sha256Hex(detail::canonicalJson(payload())) == sha256_;
    }

private:
    std::int64_t tick_;
    std::string utc_;
    std::vector<MeasurementSummary> used_;
    FusedSummary fused_;
    std::string sha256_;
};

/**
 * @brief Builds the audit record of one tick. Pure: identical inputs always
 * yield an identical record and digest.
 * @param tick Tick number.
 * @param utc Tick timestamp.
 * @param used The gated measurements the tick's fusion received.
 * @param fused The tick's fused estimate.
 */
inline AuditRecord buildAuditRecord(std::int64_t tick,
                                    const std::string& utc,
                                    const std::vector<SensorMeasurement>& used,
                                    const FusedEstimate& fused) {
    std::vector<MeasurementSummary> summaries;
    summaries.reserve(used.size());
    for (const auto& m : used) {
        summaries.push_back(MeasurementSummary::from(m));
    }
    FusedSummary fused_summary = FusedSummary::from(fused);

    std::string digest = detail::sha256Hex(
        detail::canonicalJson(AuditRecord::makePayload(tick, utc, summaries, fused_summary)));

    return AuditRecord(tick, utc, std::move(summaries), std::move(fused_summary), std::move(digest));
}

} // namespace reconfusion

#endif // RECONFUSION_AUDIT_CHAIN_HPP_
