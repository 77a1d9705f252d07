// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

enum WebApiError {
    GenericBase = 1000,
    GenericSuccess,
    GenericNoValueFound,
    GenericParseError,
    GenericValueMissing,
    GenericWriteFailed,
    GenericInternalServerError,

    EnvoyBase = 12000,
    EnvoyAddressLength,
    EnvoyTokenLength,
    EnvoyPollingInterval,
    EnvoyTimeout,
    EnvoyDisabled,
};
