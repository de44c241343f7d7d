// Copyright 2025 KVCache.AI
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "geoload/record/record_source.h"

#include <glog/logging.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>

#if __has_include(<jsoncpp/json/json.h>)
#include <jsoncpp/json/json.h>  // Ubuntu
#else
#include <json/json.h>  // CentOS
#endif

namespace geoload {

namespace {

struct Location {
    const char* country_code;
    const char* country_name;
    const char* state;
    const char* city;
    const char* zip_code;
    double lat;
    double lng;
    const char* tz;
    int utc_offset;
};

const Location kLocations[] = {
    {"US", "United States", "California", "San Francisco", "94102", 37.7749,
     -122.4194, "America/Los_Angeles", -28800},
    {"US", "United States", "New York", "New York", "10001", 40.7128, -74.0060,
     "America/New_York", -18000},
    {"US", "United States", "Texas", "Austin", "73301", 30.2672, -97.7431,
     "America/Chicago", -21600},
    {"GB", "United Kingdom", "England", "London", "SW1A 1AA", 51.5074, -0.1278,
     "Europe/London", 0},
    {"DE", "Germany", "Bavaria", "Munich", "80331", 48.1351, 11.5820,
     "Europe/Berlin", 3600},
    {"JP", "Japan", "Tokyo", "Tokyo", "100-0001", 35.6762, 139.6503,
     "Asia/Tokyo", 32400},
    {"AU", "Australia", "New South Wales", "Sydney", "2000", -33.8688,
     151.2093, "Australia/Sydney", 36000},
    {"CA", "Canada", "Ontario", "Toronto", "M5H 2N2", 43.6532, -79.3832,
     "America/Toronto", -18000},
    {"FR", "France", "Ile-de-France", "Paris", "75001", 48.8566, 2.3522,
     "Europe/Paris", 3600},
    {"BR", "Brazil", "Sao Paulo", "Sao Paulo", "01310-100", -23.5505,
     -46.6333, "America/Sao_Paulo", -10800},
    {"IN", "India", "Maharashtra", "Mumbai", "400001", 19.0760, 72.8777,
     "Asia/Kolkata", 19800},
    {"SG", "Singapore", "Singapore", "Singapore", "018989", 1.3521, 103.8198,
     "Asia/Singapore", 28800},
};

const char* const kNetworkTypes[] = {"business",  "residential", "mobile",
                                     "hosting",   "education",   "government"};
const char* const kIsps[] = {"Comcast",      "Verizon",     "AT&T",
                             "Charter",      "CenturyLink", "Cox",
                             "Spectrum",     "T-Mobile",    "Amazon AWS",
                             "Google Cloud", "Cloudflare",  "DigitalOcean"};
const char* const kOrganizations[] = {
    "Enterprise Corp",   "Tech Solutions Inc", "Global Networks Ltd",
    "Data Systems LLC",  "Cloud Services Co",  "Telecom Solutions",
    "Business Networks", "Hosting Services"};
const char* const kConnectionTypes[] = {"cable",    "dsl",      "fiber",
                                        "satellite", "cellular", "ethernet",
                                        "wireless"};
const char* const kUsageTypes[] = {"commercial", "residential", "educational",
                                   "government", "healthcare",  "financial"};
const char* const kBandwidthTiers[] = {"low",     "medium",  "high",
                                       "enterprise", "premium", "unlimited"};
const char* const kLineSpeeds[] = {"1Mbps",  "5Mbps",   "10Mbps", "25Mbps",
                                   "50Mbps", "100Mbps", "1Gbps"};
const char* const kPrivacyLevels[] = {"public", "restricted", "private",
                                      "confidential"};
const char* const kRegions[] = {"North America", "South America", "Europe",
                                "Asia Pacific",  "Middle East",   "Africa",
                                "Oceania"};
const char* const kDomains[] = {"example.com", "test.org",      "sample.net",
                                "demo.co",     "corp.internal", "business.local"};
const char* const kDnsServers[] = {"8.8.8.8", "8.8.4.4",        "1.1.1.1",
                                   "1.0.0.1", "208.67.222.222", "208.67.220.220"};
const char* const kTags[] = {"datacenter", "residential", "mobile",  "vpn",
                             "proxy",      "scanner",     "legitimate"};
const char* const kNotes[] = {
    "High-traffic address with consistent usage patterns. Monitored for "
    "security compliance.",
    "Corporate network endpoint with standard business applications. Regular "
    "security scans performed.",
    "Residential broadband connection with typical consumer usage. No "
    "security concerns identified.",
    "Mobile device connection with variable location data. Standard carrier "
    "security policies applied.",
    "Data center hosting environment with multiple virtual instances. "
    "Enhanced monitoring enabled."};

struct Asn {
    int number;
    const char* name;
};

const Asn kAsns[] = {{15169, "Google LLC"},
                     {8075, "Microsoft Corporation"},
                     {16509, "Amazon.com Inc"},
                     {13335, "Cloudflare Inc"},
                     {7922, "Comcast Cable Communications"},
                     {701, "Verizon Business"},
                     {3356, "Level 3 Parent LLC"},
                     {174, "Cogent Communications"}};

uint64_t fnv1a(std::string_view text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

// Knuth MMIX linear congruential generator; stable across platforms,
// unlike the std distributions.
class Lcg {
   public:
    explicit Lcg(uint64_t seed) : state_(seed) {}

    uint64_t next() {
        state_ = state_ * 6364136223846793005ULL + 1442695040888963407ULL;
        return state_ >> 33;
    }

    uint64_t below(uint64_t bound) { return next() % bound; }

    int range(int lo, int hi) {
        return lo + static_cast<int>(below(static_cast<uint64_t>(hi - lo + 1)));
    }

    double uniform(double lo, double hi) {
        return lo + (hi - lo) * (static_cast<double>(next() & 0xFFFFFF) /
                                 static_cast<double>(0xFFFFFF));
    }

    bool flip() { return (next() & 1) != 0; }

    template <typename T, size_t N>
    const T& pick(const T (&items)[N]) {
        return items[below(N)];
    }

   private:
    uint64_t state_;
};

double round6(double v) { return std::round(v * 1e6) / 1e6; }

std::string toCompactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

}  // namespace

SyntheticRecordSource::SyntheticRecordSource(uint32_t sample_set_size) {
    if (sample_set_size == 0) sample_set_size = kDefaultSampleSetSize;
    samples_.reserve(sample_set_size);
    for (uint32_t i = 0; i < sample_set_size; ++i) {
        samples_.push_back(buildSample(i));
    }
    computeAverage();
}

SyntheticRecordSource::SyntheticRecordSource(std::vector<std::string> samples)
    : samples_(std::move(samples)) {
    computeAverage();
}

void SyntheticRecordSource::computeAverage() {
    size_t total = 0;
    for (const auto& sample : samples_) total += sample.size();
    average_size_ = samples_.empty()
                        ? 0.0
                        : static_cast<double>(total) / samples_.size();
}

std::string SyntheticRecordSource::buildSample(uint32_t index) {
    Lcg rng(fnv1a("sample-" + std::to_string(index)));

    std::string ip = "10." + std::to_string((index >> 16) & 0xFF) + "." +
                     std::to_string((index >> 8) & 0xFF) + "." +
                     std::to_string(index & 0xFF);
    std::string dashed = ip;
    for (auto& c : dashed) {
        if (c == '.') c = '-';
    }

    const Location& loc = rng.pick(kLocations);
    Json::Value doc;
    doc["ip"] = ip;
    doc["network"] = ip.substr(0, ip.rfind('.')) + ".0/24";
    doc["is_private"] = false;
    doc["timestamp"] = Json::UInt64(1727026200ULL + index);

    doc["country_code"] = loc.country_code;
    doc["country_name"] = loc.country_name;
    doc["state"] = loc.state;
    doc["city"] = loc.city;
    doc["zip_code"] = loc.zip_code;
    doc["latitude"] = round6(loc.lat + rng.uniform(-0.1, 0.1));
    doc["longitude"] = round6(loc.lng + rng.uniform(-0.1, 0.1));
    doc["region"] = rng.pick(kRegions);
    doc["postal_code"] = std::string(loc.zip_code) +
                         (std::string(loc.country_code) == "US"
                              ? "-" + std::to_string(rng.range(1000, 9999))
                              : "");
    doc["area_code"] = std::to_string(rng.range(200, 999));
    doc["metro_code"] = rng.range(500, 900);
    doc["timezone_id"] = loc.tz;
    doc["utc_offset"] = loc.utc_offset;
    doc["dst_active"] = rng.flip();

    const char* network_type = rng.pick(kNetworkTypes);
    const char* domain = rng.pick(kDomains);
    const Asn& asn = rng.pick(kAsns);
    doc["network_type"] = network_type;
    doc["isp"] = rng.pick(kIsps);
    doc["organization"] = rng.pick(kOrganizations);
    doc["asn"] = asn.number;
    doc["asn_name"] = asn.name;
    doc["connection_type"] = rng.pick(kConnectionTypes);
    doc["usage_type"] = rng.pick(kUsageTypes);
    doc["domain"] = domain;
    doc["hostname"] = "host-" + dashed + "." + domain;
    doc["line_speed"] = rng.pick(kLineSpeeds);
    doc["static_ip"] = rng.flip();

    doc["vpn_detected"] = rng.flip();
    doc["proxy_detected"] = rng.flip();
    doc["reputation_score"] =
        std::round(rng.uniform(0.0, 100.0) * 100.0) / 100.0;
    doc["last_seen_malware"] =
        rng.below(10) < 7 ? "never" : "2024-09-15T10:30:00Z";
    doc["bandwidth_tier"] = rng.pick(kBandwidthTiers);
    doc["estimated_users"] = rng.range(1, 500);
    doc["gdpr_applicable"] = rng.flip();
    doc["privacy_level"] = rng.pick(kPrivacyLevels);

    doc["ip_version"] = 4;
    doc["subnet_mask"] = "255.255.255.0";
    doc["gateway"] = ip.substr(0, ip.rfind('.')) + ".1";
    Json::Value dns(Json::arrayValue);
    int dns_count = rng.range(2, 4);
    for (int i = 0; i < dns_count; ++i) {
        dns.append(kDnsServers[(index + i) % std::size(kDnsServers)]);
    }
    doc["dns_servers"] = dns;
    doc["notes"] = rng.pick(kNotes);
    Json::Value tags(Json::arrayValue);
    int tag_count = rng.range(2, 5);
    for (int i = 0; i < tag_count; ++i) {
        tags.append(kTags[(index * 3 + i) % std::size(kTags)]);
    }
    doc["tags"] = tags;

    Json::Value custom;
    custom["scan_frequency"] = rng.flip() ? "daily" : "weekly";
    custom["monitoring_level"] = rng.flip() ? "basic" : "enhanced";
    custom["last_updated"] = "2024-09-22T17:30:00Z";
    custom["data_source"] = "geoload-synthetic";
    doc["custom_fields"] = custom;

    return toCompactJson(doc);
}

Status SyntheticRecordSource::fromFile(
    const std::string& path, std::shared_ptr<SyntheticRecordSource>& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Status::InvalidArgument("cannot open sample file " + path +
                                       LOC_MARK);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, file, &root, &errs)) {
        return Status::MalformedConfig("failed to parse sample file " + path +
                                       ": " + errs + LOC_MARK);
    }
    if (!root.isObject() || root.empty()) {
        return Status::MalformedConfig("sample file " + path +
                                       " must be a non-empty JSON object" +
                                       LOC_MARK);
    }

    // Entries are keyed "0".."n-1"; a gap ends the usable range.
    std::vector<std::string> samples;
    samples.reserve(root.size());
    for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
        const std::string member = std::to_string(i);
        if (!root.isMember(member)) {
            LOG(WARNING) << "Sample file " << path << " has no entry " << member
                         << ", using the first " << i << " samples";
            break;
        }
        samples.push_back(toCompactJson(root[member]));
    }
    if (samples.empty()) {
        return Status::MalformedConfig("sample file " + path +
                                       " has no entry \"0\"" + LOC_MARK);
    }

    out.reset(new SyntheticRecordSource(std::move(samples)));
    LOG(INFO) << "Loaded " << out->sampleCount() << " samples from " << path
              << ", average size " << out->averagePayloadSize() << " bytes";
    return Status::OK();
}

const std::string& SyntheticRecordSource::generate(uint64_t id) const {
    return samples_[id % samples_.size()];
}

const std::string& SyntheticRecordSource::generate(std::string_view id) const {
    uint64_t numeric = 0;
    auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), numeric);
    if (ec == std::errc() && ptr == id.data() + id.size() && !id.empty()) {
        return generate(numeric);
    }
    return generate(fnv1a(id));
}

Status createRecordSource(const std::string& sample_file,
                          uint32_t sample_set_size,
                          std::shared_ptr<const RecordSource>& out) {
    if (!sample_file.empty()) {
        std::shared_ptr<SyntheticRecordSource> loaded;
        CHECK_STATUS(SyntheticRecordSource::fromFile(sample_file, loaded));
        out = std::move(loaded);
        return Status::OK();
    }
    auto source = std::make_shared<SyntheticRecordSource>(sample_set_size);
    LOG(INFO) << "Built " << source->sampleCount()
              << " synthetic samples, average size "
              << source->averagePayloadSize() << " bytes";
    out = std::move(source);
    return Status::OK();
}

}  // namespace geoload
