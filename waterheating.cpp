//
//  waterheating.cpp
//  planner
//

#include "waterheating.hpp"
#include "plannertime.hpp"
#include "plannerlog.hpp"
#include "Planner_CONF.h"
#include <algorithm>
#include <math.h>

std::vector<watersegment_s> BuildWaterSegments(const slotseries_t &series, const std::vector<int> &cand,
                                               int max_gap_slots, float tolerance)
{
    std::vector<watersegment_s> segs;
    int maxgap = std::max(0, max_gap_slots);
    time_t allowed = (time_t)SLOTSECONDS * std::max(1, maxgap + 1);
    tolerance = std::max(0.0f, tolerance);

    watersegment_s cur;
    cur.avg = 0;
    cur.pmin = cur.pmax = 0;
    time_t prev = 0;
    for (size_t k = 0; k < cand.size(); k++)
    {
        int j = cand[k];
        float p = series[j].import_price;
        if (cur.idx.size() > 0)
        {
            float lo = std::min(cur.pmin, p);
            float hi = std::max(cur.pmax, p);
            // Lücke überbrücken nur solange die Preisspanne passt
            if (series[j].hh - prev <= allowed && hi - lo <= tolerance + 1e-6)
            {
                cur.idx.push_back(j);
                cur.pmin = lo;
                cur.pmax = hi;
                prev = series[j].hh;
                continue;
            }
            segs.push_back(cur);
            cur.idx.clear();
        }
        cur.idx.push_back(j);
        cur.pmin = cur.pmax = p;
        prev = series[j].hh;
    }
    if (cur.idx.size() > 0)
        segs.push_back(cur);

    for (size_t k = 0; k < segs.size(); k++)
    {
        float sum = 0;
        for (size_t l = 0; l < segs[k].idx.size(); l++)
            sum += series[segs[k].idx[l]].import_price;
        segs[k].avg = sum / segs[k].idx.size();
    }
    std::stable_sort(segs.begin(), segs.end(), [&series](const watersegment_s &a, const watersegment_s &b)
    {
        if (a.avg != b.avg)
            return a.avg < b.avg;
        return series[a.idx[0]].hh < series[b.idx[0]].hh;
    });
    return segs;
}

std::vector<int> SelectWaterSlots(const slotseries_t &series, const std::vector<int> &cand, int needed,
                                  int max_gap_slots, float tolerance)
{
    std::vector<int> chosen;
    if (needed <= 0 || cand.size() == 0)
        return chosen;
    std::vector<watersegment_s> segs = BuildWaterSegments(series, cand, max_gap_slots, tolerance);
    int total = 0;
    for (size_t k = 0; k < segs.size() && total < needed; k++)
    {
        const std::vector<int> &idx = segs[k].idx;
        int n = (int)idx.size();
        if (total + n <= needed)
        {
            chosen.insert(chosen.end(), idx.begin(), idx.end());
            total += n;
            continue;
        }
        // letzter Abschnitt: günstigster zusammenhängender Lauf
        int want = needed - total;
        int best = 0;
        float bestcost = 0;
        for (int b = 0; b + want <= n; b++)
        {
            float cost = 0;
            for (int l = b; l < b + want; l++)
                cost += series[idx[l]].import_price;
            if (b == 0 || cost < bestcost)
            {
                best = b;
                bestcost = cost;
            }
        }
        chosen.insert(chosen.end(), idx.begin() + best, idx.begin() + best + want);
        total = needed;
    }
    std::sort(chosen.begin(), chosen.end());
    return chosen;
}

static float BlockCost(const slotseries_t &series, const std::vector<int> &block)
{
    float cost = 0;
    for (size_t k = 0; k < block.size(); k++)
        cost += series[block[k]].import_price;
    return cost;
}

std::vector<std::vector<int> > ConsolidateWaterBlocks(const slotseries_t &series, const std::vector<int> &selected,
                                                      int max_blocks, const std::vector<bool> &avail)
{
    std::vector<std::vector<int> > blocks;
    for (size_t k = 0; k < selected.size(); k++)
    {
        int j = selected[k];
        if (blocks.size() > 0 && blocks.back().back() + 1 == j
            && series[j].hh - series[j - 1].hh == SLOTSECONDS)
            blocks.back().push_back(j);
        else
            blocks.push_back(std::vector<int>(1, j));
    }

    while ((int)blocks.size() > max_blocks)
    {
        int best = -1;
        int bestwin = 0;
        float bestpen = 0;
        for (size_t i = 0; i + 1 < blocks.size(); i++)
        {
            const std::vector<int> &a = blocks[i];
            const std::vector<int> &b = blocks[i + 1];
            int len = (int)(a.size() + b.size());
            float cost_ab = BlockCost(series, a) + BlockCost(series, b);
            // Fenster gleicher Länge innerhalb der Spanne beider Blöcke
            for (int w = a.front(); w + len - 1 <= b.back(); w++)
            {
                bool ok = true;
                float cost = 0;
                for (int j = w; j < w + len && ok; j++)
                {
                    ok = avail[j] && (j == w || series[j].hh - series[j - 1].hh == SLOTSECONDS);
                    cost += series[j].import_price;
                }
                if (not ok)
                    continue;
                float pen = cost - cost_ab;
                if (best < 0 || pen < bestpen - 1e-6)
                {
                    best = (int)i;
                    bestwin = w;
                    bestpen = pen;
                }
            }
        }
        if (best < 0)
        {
            WriteLog(LOGWARN, "Warmwasser: %i Blöcke lassen sich nicht auf %i zusammenlegen",
                     (int)blocks.size(), max_blocks);
            break;
        }
        int len = (int)(blocks[best].size() + blocks[best + 1].size());
        std::vector<int> merged;
        for (int j = bestwin; j < bestwin + len; j++)
            merged.push_back(j);
        WriteLog(LOGDEBUG, "Warmwasser: Blöcke %s und %s zusammengelegt, Aufpreis %.4f",
                 FormatTimestamp(series[blocks[best].front()].hh).c_str(),
                 FormatTimestamp(series[blocks[best + 1].front()].hh).c_str(), bestpen);
        blocks[best] = merged;
        blocks.erase(blocks.begin() + best + 1);
    }
    return blocks;
}

bool HasFullPriceDay(const slotseries_t &series, int day)
{
    time_t t0 = DayStart(day);
    time_t t1 = DayStart(day + 1);
    int expected = (int)((t1 - t0) / SLOTSECONDS);
    int n = 0;
    for (size_t j = 0; j < series.size(); j++)
        if (series[j].hh >= t0 && series[j].hh < t1)
            n++;
    return n >= expected;
}

// Bedarf innerhalb [from, to) decken, topup: notfalls auch teure Slots
static waterday_s PlanWindow(slotseries_t &series, const planner_config_t &cfg, int day, time_t from, time_t to,
                             time_t now, float required, float consumed, bool topup)
{
    waterday_s wd = {day, required, consumed, 0, 0, 0, 0, false, 0, topup};
    float slot_energy = cfg.water.power_kw * SLOTHOURS;
    float remaining = std::max(0.0f, required - consumed);
    if (remaining <= 0 || slot_energy <= 0)
        return wd;
    wd.slots_needed = (int)ceil(remaining / slot_energy - 1e-4);

    std::vector<int> cand;
    std::vector<bool> avail(series.size(), false);
    for (size_t j = 0; j < series.size(); j++)
    {
        const slot_s &s = series[j];
        if (s.hh < from || s.hh >= to || s.hh < now || s.water_kw > 0)
            continue;
        avail[j] = true;
        if (s.cheap)
            cand.push_back((int)j);
    }
    std::vector<int> sel = SelectWaterSlots(series, cand, wd.slots_needed, WaterMaxGap(cfg), WaterTolerance(cfg));
    if (topup && (int)sel.size() < wd.slots_needed)
    {
        std::vector<int> rest;
        for (size_t j = 0; j < series.size(); j++)
            if (avail[j] && not std::binary_search(sel.begin(), sel.end(), (int)j))
                rest.push_back((int)j);
        std::stable_sort(rest.begin(), rest.end(), [&series](int a, int b)
        {
            return series[a].import_price < series[b].import_price;
        });
        for (size_t k = 0; k < rest.size() && (int)sel.size() < wd.slots_needed; k++)
            sel.push_back(rest[k]);
        std::sort(sel.begin(), sel.end());
    }

    std::vector<std::vector<int> > blocks = ConsolidateWaterBlocks(series, sel, cfg.water.max_blocks, avail);
    for (size_t b = 0; b < blocks.size(); b++)
        for (size_t k = 0; k < blocks[b].size(); k++)
        {
            series[blocks[b][k]].water_kw = cfg.water.power_kw;
            wd.slots_scheduled++;
        }
    wd.blocks = (int)blocks.size();
    wd.scheduled_kwh = wd.slots_scheduled * slot_energy;
    return wd;
}

static float UsageOn(const snapshot_s &snap, int day, int today)
{
    if (day == today && snap.water_heated_today_kwh.set)
        return std::max(0.0f, snap.water_heated_today_kwh.val);
    dailymap_t::const_iterator it = snap.water_usage.find(day);
    return it == snap.water_usage.end() ? 0 : std::max(0.0f, it->second);
}

waterresult_s ScheduleWater(slotseries_t &series, const planner_config_t &cfg, const snapshot_s &snap, time_t now)
{
    waterresult_s wr;
    wr.enabled = WaterEnabled(cfg);
    wr.vacation = cfg.water.vacation_mode || snap.vacation_mode;
    wr.total_slots = 0;
    wr.total_kwh = 0;
    for (size_t j = 0; j < series.size(); j++)
        series[j].water_kw = 0;
    if (not wr.enabled || series.size() == 0)
        return wr;

    int today = LocalDay(now);
    if (wr.vacation)
    {
        // Urlaub: nur Legionellenschaltung
        time_t last = snap.last_anti_legionella;
        float heated = UsageOn(snap, today, today);
        if (last == 0 && heated >= 2.0)
        {
            WriteLog(LOGINFO, "Urlaub: heute %.1f kWh erwärmt, gilt als Legionellenschaltung", heated);
            last = now;
        }
        int days_since = last > 0 ? (int)((now - last) / 86400) : 999;
        if (days_since >= cfg.water.al_interval_days - 1 && LocalHour(now) >= ALEARLIESTHOUR)
        {
            float kwh = cfg.water.al_duration_hours * cfg.water.power_kw;
            WriteLog(LOGINFO, "Legionellenschaltung fällig (%i Tage), %.1f kWh", days_since, kwh);
            wr.days.push_back(PlanWindow(series, cfg, today, DayStart(today), DayStart(today + 2), now, kwh, 0, true));
        }
        else
            WriteLog(LOGDEBUG, "Legionellenschaltung nicht fällig: %i Tage, %i Uhr", days_since, LocalHour(now));
    }
    else
    {
        float minkwh = WaterMinKwh(cfg);
        for (int offset = 0; offset <= cfg.water.plan_days_ahead; offset++)
        {
            int day = today + offset;
            if (offset > 0 && not HasFullPriceDay(series, day))
            {
                WriteLog(LOGDEBUG, "Warmwasser %s: Preise noch nicht vollständig", FormatDay(day).c_str());
                continue;
            }
            waterday_s wd = PlanWindow(series, cfg, day, DayStart(day), DayStart(day + 1), now,
                                       minkwh, UsageOn(snap, day, today), false);
            int shortfall = wd.slots_needed - wd.slots_scheduled;
            if (shortfall > 0 && offset == 0 && cfg.water.defer_hours > 0 && HasFullPriceDay(series, today + 1))
            {
                // Rest in die ersten günstigen Slots von morgen schieben
                time_t t0 = DayStart(today + 1);
                time_t t1 = t0 + (time_t)(cfg.water.defer_hours * 3600);
                for (size_t j = 0; j < series.size() && shortfall > 0; j++)
                {
                    slot_s &s = series[j];
                    if (s.hh >= t0 && s.hh < t1 && s.hh >= now && s.cheap && s.water_kw <= 0)
                    {
                        s.water_kw = cfg.water.power_kw;
                        wd.deferred_slots++;
                        wd.slots_scheduled++;
                        shortfall--;
                    }
                }
                wd.deferred = wd.deferred_slots > 0;
                wd.scheduled_kwh = wd.slots_scheduled * cfg.water.power_kw * SLOTHOURS;
                if (wd.deferred)
                    WriteLog(LOGINFO, "Warmwasser: %i Slots auf morgen verschoben", wd.deferred_slots);
            }
            if (shortfall > 0)
                WriteLog(LOGINFO, "Warmwasser %s: %i von %i Slots nicht planbar", FormatDay(day).c_str(),
                         shortfall, wd.slots_needed);
            wr.days.push_back(wd);
        }
    }
    for (size_t k = 0; k < wr.days.size(); k++)
    {
        wr.total_slots += wr.days[k].slots_scheduled;
        wr.total_kwh += wr.days[k].scheduled_kwh;
    }
    WriteLog(LOGDEBUG, "Warmwasser: %i Slots, %.2f kWh", wr.total_slots, wr.total_kwh);
    return wr;
}
