/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "errors.hpp"
#include "logger.hpp"
#include "payment_model.hpp"
#include "parser.hpp"
#include "flatten.hpp"
#include "translator.hpp"
#include "validator.hpp"
#include "anonymizer.hpp"
#include "reconciler.hpp"
