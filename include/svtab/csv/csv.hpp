/**
 * @file csv.hpp
 * @brief Master include for svtab CSV tables
 *
 * Includes the record reader and the csv module source.
 */

#pragma once

#include <svtab/csv/reader.hpp>
#include <svtab/csv/source.hpp>
