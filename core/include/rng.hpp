#pragma once
#include <cstdint>
// xorshift32, deterministic per seed
struct Rng{ uint32_t s; explicit Rng(uint32_t seed=1):s(seed?seed:1){}
uint32_t next(){ uint32_t x=s; x^=x<<13; x^=x>>17; x^=x<<5; s=x; return x;}
// inclusive [lo, hi]
int range(int lo, int hi){ if(hi<=lo) return lo; return lo + (int)(next() % (uint32_t)(hi-lo+1)); }
bool chance(int percent){ if(percent<=0) return false; if(percent>=100) return true; return (int)(next()%100u) < percent; } };
