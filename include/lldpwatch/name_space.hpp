#pragma once
#ifndef NSNAME
#define NSNAME lldpwatch
#endif
