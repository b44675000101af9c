/**
 * @file iscanapiclient.cpp
 * @brief Translation unit for the IScanApiClient interface, so moc output has a home.
 */

#include "iscanapiclient.h"
