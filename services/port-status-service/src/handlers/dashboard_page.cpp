/**
 * @file dashboard_page.cpp
 * @brief Dashboard markup
 */

#include "dashboard_page.h"

namespace handlers {

std::string_view dashboardHtml() {
    static constexpr std::string_view html = R"HTML(<!DOCTYPE html>
<html>
<head>
    <title>Free Deep Research - Port Status Dashboard</title>
    <meta charset="utf-8">
    <meta name="viewport" content="width=device-width, initial-scale=1">
    <style>
        body { font-family: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, sans-serif;
               margin: 0; padding: 20px; background: #f4f6f8; color: #222; }
        .container { max-width: 1200px; margin: 0 auto; }
        h1 { margin-bottom: 4px; }
        .subtitle { color: #666; margin-top: 0; }
        .grid { display: grid; grid-template-columns: repeat(auto-fill, minmax(260px, 1fr)); gap: 16px; }
        .card { background: #fff; border-radius: 8px; padding: 16px; box-shadow: 0 1px 3px rgba(0,0,0,.12); }
        .card h3 { margin: 0 0 8px 0; }
        .status { display: inline-block; padding: 2px 8px; border-radius: 10px; font-size: 12px; }
        .running, .in_use { background: #d4edda; color: #155724; }
        .free { background: #e2e3e5; color: #383d41; }
        .exited, .stopped { background: #f8d7da; color: #721c24; }
        table { width: 100%; border-collapse: collapse; background: #fff; }
        th, td { text-align: left; padding: 8px; border-bottom: 1px solid #eee; font-size: 14px; }
        button { padding: 8px 16px; border: none; border-radius: 4px; background: #0366d6; color: #fff; cursor: pointer; }
        .error { color: #b00020; }
    </style>
</head>
<body>
<div class="container">
    <h1>Free Deep Research</h1>
    <p class="subtitle">Port and service status <span id="updated"></span></p>
    <button onclick="refreshAll()">Refresh</button>

    <h2>Running Services</h2>
    <div id="services" class="grid">Loading...</div>

    <h2>Port Assignments</h2>
    <table>
        <thead><tr><th>Key</th><th>Port</th><th>Status</th><th>URL</th></tr></thead>
        <tbody id="ports"><tr><td colspan="4">Loading...</td></tr></tbody>
    </table>

    <h2>Containers</h2>
    <table>
        <thead><tr><th>Name</th><th>Status</th><th>Image</th><th>Ports</th><th>Created</th></tr></thead>
        <tbody id="containers"><tr><td colspan="5">Loading...</td></tr></tbody>
    </table>
</div>
<script>
function text(value) {
    var span = document.createElement('span');
    span.textContent = value == null ? '' : String(value);
    return span.innerHTML;
}

async function fetchJson(path) {
    var response = await fetch(path);
    return response.json();
}

async function loadServices() {
    var target = document.getElementById('services');
    try {
        var data = await fetchJson('/services');
        var keys = Object.keys(data.services || {});
        if (keys.length === 0) {
            target.innerHTML = '<p>No services running.</p>';
            return;
        }
        target.innerHTML = keys.map(function (key) {
            var s = data.services[key];
            return '<div class="card"><h3>' + text(s.icon) + ' ' + text(s.name) + '</h3>' +
                   '<span class="status ' + text(s.status) + '">' + text(s.status) + '</span>' +
                   '<p><a href="' + text(s.url) + '" target="_blank">' + text(s.url) + '</a></p>' +
                   '<p>Port ' + text(s.port) + '</p></div>';
        }).join('');
    } catch (e) {
        target.innerHTML = '<p class="error">Failed to load services</p>';
    }
}

async function loadPorts() {
    var target = document.getElementById('ports');
    try {
        var data = await fetchJson('/ports');
        var keys = Object.keys(data.ports || {});
        target.innerHTML = keys.map(function (key) {
            var p = data.ports[key];
            var link = p.url ? '<a href="' + text(p.url) + '" target="_blank">' + text(p.url) + '</a>' : '';
            return '<tr><td>' + text(key) + '</td><td>' + text(p.port) + '</td>' +
                   '<td><span class="status ' + text(p.status) + '">' + text(p.status) + '</span></td>' +
                   '<td>' + link + '</td></tr>';
        }).join('') || '<tr><td colspan="4">No port assignments.</td></tr>';
    } catch (e) {
        target.innerHTML = '<tr><td colspan="4" class="error">Failed to load ports</td></tr>';
    }
}

async function loadContainers() {
    var target = document.getElementById('containers');
    try {
        var data = await fetchJson('/containers');
        target.innerHTML = (data.containers || []).map(function (c) {
            return '<tr><td>' + text(c.name) + '</td>' +
                   '<td><span class="status ' + text(c.status) + '">' + text(c.status) + '</span></td>' +
                   '<td>' + text(c.image) + '</td><td>' + text(c.ports) + '</td>' +
                   '<td>' + text(c.created) + '</td></tr>';
        }).join('') || '<tr><td colspan="5">No containers found.</td></tr>';
    } catch (e) {
        target.innerHTML = '<tr><td colspan="5" class="error">Failed to load containers</td></tr>';
    }
}

function refreshAll() {
    loadServices();
    loadPorts();
    loadContainers();
    document.getElementById('updated').textContent = '(updated ' + new Date().toLocaleTimeString() + ')';
}

refreshAll();
setInterval(refreshAll, 30000);
</script>
</body>
</html>
)HTML";
    return html;
}

} // namespace handlers
