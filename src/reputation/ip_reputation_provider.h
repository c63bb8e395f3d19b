#pragma once
#include <string>

#include "core/probe_result.h"

/**
 * A keyed IP reputation API.
 *
 * check() returns Absent when no credential is supplied (the provider is
 * switched off, not "clean"), Ok with the normalized report, or Error with a
 * description of the transport or decoding failure. It never throws.
 */
template <typename Report>
class IpReputationProvider {
public:
    virtual ~IpReputationProvider() = default;

    virtual ProbeResult<Report> check(const std::string& ip,
                                      const std::string& credential) = 0;

    virtual std::string name() const = 0;
};
