/**
 * Unity Test Framework Configuration
 *
 * Picked up by unity.h when UNITY_INCLUDE_CONFIG_H is defined.
 */

#ifndef GL_UNITY_CONFIG_H
#define GL_UNITY_CONFIG_H

#include <stdint.h>
#include <stdio.h>

#define UNITY_OUTPUT_CHAR(c) putchar(c)
#define UNITY_OUTPUT_FLUSH() fflush(stdout)

#define UNITY_SUPPORT_64

// Colour model and meander suites compare doubles
#define UNITY_INCLUDE_FLOAT
#define UNITY_INCLUDE_DOUBLE

#endif // GL_UNITY_CONFIG_H
