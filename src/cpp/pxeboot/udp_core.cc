//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <pxeboot/log.h>
#include <pxeboot/udp_core.h>

void pxeboot::udp::Endpoint::log_to(pxeboot::log::LogBuffer& wr) const {
    addr.log_to(wr);
    wr.wr_str(":");
    wr.wr_dec(port.value);
}
